#include <gtest/gtest.h>
#include <sstream>
#include "errors/errors.hpp"
#include "stream/source_stream.hpp"

using namespace teldrive;

namespace
{
    std::string pattern(size_t n)
    {
        std::string s(n, '\0');
        for (size_t i = 0; i < n; i++)
            s[i] = static_cast<char>('a' + i % 26);
        return s;
    }
}

TEST(SourceStreamTest, ReadAndDiscardConsumeExactCounts)
{
    std::istringstream in(pattern(100));
    SourceStream source(in);

    EXPECT_EQ(source.readExactly(3), "abc");
    source.discardExactly(23);
    EXPECT_EQ(source.consumed(), 26u);
    EXPECT_EQ(source.readExactly(2), "ab");
    source.discardExactly(0);
    EXPECT_EQ(source.consumed(), 28u);
}

TEST(SourceStreamTest, LargeDiscardSpansBufferBoundaries)
{
    const size_t size = 300 * 1024 + 7;
    std::istringstream in(pattern(size) + "XYZ");
    SourceStream source(in);
    source.discardExactly(size);
    EXPECT_EQ(source.readExactly(3), "XYZ");
}

TEST(SourceStreamTest, ShortStreamThrows)
{
    std::istringstream in("12345");
    SourceStream source(in);
    EXPECT_THROW(source.readExactly(6), StreamError);

    std::istringstream in2("12345");
    SourceStream source2(in2);
    EXPECT_THROW(source2.discardExactly(10), StreamError);
}

TEST(BoundedReaderTest, StopsAtWindowEnd)
{
    std::istringstream in("0123456789");
    SourceStream source(in);
    BoundedReader window(source, 4);

    char buf[16];
    EXPECT_EQ(window.read(buf, 3), 3u);
    EXPECT_EQ(std::string(buf, 3), "012");
    EXPECT_EQ(window.read(buf, sizeof(buf)), 1u);
    EXPECT_EQ(buf[0], '3');
    EXPECT_EQ(window.read(buf, sizeof(buf)), 0u);
    EXPECT_EQ(window.remaining(), 0u);
    EXPECT_NO_THROW(window.finish());

    // Next window continues where the previous one ended.
    BoundedReader next(source, 6);
    EXPECT_EQ(next.read(buf, sizeof(buf)), 6u);
    EXPECT_EQ(std::string(buf, 6), "456789");
}

TEST(BoundedReaderTest, FinishDetectsUnconsumedBytes)
{
    std::istringstream in("0123456789");
    SourceStream source(in);
    BoundedReader window(source, 8);
    char buf[4];
    window.read(buf, sizeof(buf));
    EXPECT_EQ(window.remaining(), 4u);
    EXPECT_THROW(window.finish(), StreamError);
}

TEST(BoundedReaderTest, WindowPastEndOfStreamThrowsOnRead)
{
    std::istringstream in("abc");
    SourceStream source(in);
    BoundedReader window(source, 5);
    char buf[8];
    EXPECT_THROW(window.read(buf, sizeof(buf)), StreamError);
}
