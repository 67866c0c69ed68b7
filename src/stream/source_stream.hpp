#pragma once

#include <cstdint>
#include <istream>
#include <string>

namespace teldrive
{
    // Sequential, non-seekable view over an input stream. Every operation
    // consumes exactly the requested number of bytes or throws StreamError.
    class SourceStream
    {
    public:
        explicit SourceStream(std::istream &in);

        void readExactly(char *dst, uint64_t n);
        std::string readExactly(uint64_t n);
        void discardExactly(uint64_t n);

        // Total bytes consumed so far, read or discarded.
        uint64_t consumed() const { return consumed_; }

    private:
        std::istream &in_;
        uint64_t consumed_;
    };

    // Window of at most `limit` bytes over a SourceStream, handed to the HTTP
    // layer as a request body.
    class BoundedReader
    {
    public:
        BoundedReader(SourceStream &source, uint64_t limit);

        // Copies up to `max` bytes; returns 0 once the window is exhausted.
        size_t read(char *dst, size_t max);

        uint64_t size() const { return limit_; }
        uint64_t remaining() const { return limit_ - taken_; }

        // Throws StreamError if the consumer stopped before the window end.
        void finish();

    private:
        SourceStream &source_;
        uint64_t limit_;
        uint64_t taken_;
    };
}
