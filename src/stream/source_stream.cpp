#include "source_stream.hpp"
#include "../errors/errors.hpp"
#include <algorithm>
#include <vector>

namespace teldrive
{
    namespace
    {
        constexpr size_t DISCARD_BUFFER_SIZE = 64 * 1024;
        constexpr uint64_t MAX_READ_STEP = 1ull << 30;
    }

    SourceStream::SourceStream(std::istream &in) : in_(in), consumed_(0) {}

    void SourceStream::readExactly(char *dst, uint64_t n)
    {
        uint64_t done = 0;
        while (done < n)
        {
            std::streamsize want = static_cast<std::streamsize>(std::min<uint64_t>(n - done, MAX_READ_STEP));
            in_.read(dst + done, want);
            std::streamsize got = in_.gcount();
            done += static_cast<uint64_t>(got);
            consumed_ += static_cast<uint64_t>(got);
            if (got < want)
            {
                throw StreamError("unexpected end of stream: wanted " + std::to_string(n) +
                                  " bytes, got " + std::to_string(done));
            }
        }
    }

    std::string SourceStream::readExactly(uint64_t n)
    {
        std::string out(static_cast<size_t>(n), '\0');
        readExactly(&out[0], n);
        return out;
    }

    void SourceStream::discardExactly(uint64_t n)
    {
        std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(n, DISCARD_BUFFER_SIZE)));
        uint64_t left = n;
        while (left > 0)
        {
            uint64_t step = std::min<uint64_t>(left, buffer.size());
            readExactly(buffer.data(), step);
            left -= step;
        }
    }

    BoundedReader::BoundedReader(SourceStream &source, uint64_t limit)
        : source_(source), limit_(limit), taken_(0) {}

    size_t BoundedReader::read(char *dst, size_t max)
    {
        uint64_t step = std::min<uint64_t>(max, remaining());
        if (step == 0)
            return 0;
        source_.readExactly(dst, step);
        taken_ += step;
        return static_cast<size_t>(step);
    }

    void BoundedReader::finish()
    {
        if (taken_ != limit_)
        {
            throw StreamError("body window not fully consumed: " + std::to_string(taken_) +
                              " of " + std::to_string(limit_) + " bytes");
        }
    }
}
