#include <gtest/gtest.h>
#include "dosrestore/Errors.hpp"
#include "dosrestore/Materializer.hpp"
#include "BackupFixture.hpp"
#include <sys/stat.h>
#include <vector>

using namespace dosrestore;
using namespace dosrestore::test;

namespace {

class MaterializerTest : public BackupDirTest {
protected:
    PlannedAction chunk(unsigned volume, const std::string& dest, uint16_t seq,
                        uint32_t offset, uint32_t length, bool final, uint32_t finalSize) {
        PlannedAction a;
        a.control_path = (m_source / volumeName("CONTROL", volume)).string();
        a.payload_path = (m_source / volumeName("BACKUP", volume)).string();
        a.destination = dest;
        a.fragment_sequence = seq;
        a.payload_offset = offset;
        a.payload_length = length;
        a.is_final_fragment = final;
        a.final_size = finalSize;
        return a;
    }

    void writePayload(unsigned volume, const Bytes& bytes) {
        writeBytes(m_source / volumeName("BACKUP", volume), bytes);
    }
};

Bytes slice(const Bytes& b, size_t offset, size_t length) {
    return Bytes(b.begin() + offset, b.begin() + offset + length);
}

} // namespace

TEST_F(MaterializerTest, CopiesOneChunk) {
    Bytes payload = patternBytes(20, 3);
    writePayload(1, payload);

    Materializer m(m_output, false);
    MaterializeStats stats = m.materialize({chunk(1, "A.TXT", 1, 7, 5, true, 5)});

    EXPECT_EQ(readBytes(m_output / "A.TXT"), slice(payload, 7, 5));
    EXPECT_EQ(stats.chunks_copied, 1u);
    EXPECT_EQ(stats.files_touched, 1u);
    EXPECT_EQ(stats.bytes_written, 5u);
}

TEST_F(MaterializerTest, AppendsLaterFragments) {
    Bytes first = patternBytes(100, 1);
    Bytes second = patternBytes(150, 2);
    writePayload(1, first);
    writePayload(2, second);

    Materializer m(m_output, false);
    MaterializeStats stats = m.materialize({chunk(1, "BIG.DAT", 1, 0, 100, false, 250),
                                            chunk(2, "BIG.DAT", 2, 0, 150, true, 250)});

    Bytes expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    EXPECT_EQ(readBytes(m_output / "BIG.DAT"), expected);
    EXPECT_EQ(stats.chunks_copied, 2u);
    EXPECT_EQ(stats.files_touched, 1u);
    EXPECT_EQ(stats.bytes_written, 250u);
}

TEST_F(MaterializerTest, FirstFragmentTruncates) {
    writeBytes(m_output / "A.TXT", patternBytes(64, 9));
    Bytes payload = patternBytes(5, 4);
    writePayload(1, payload);

    Materializer m(m_output, false);
    m.materialize({chunk(1, "A.TXT", 1, 0, 5, true, 5)});
    EXPECT_EQ(readBytes(m_output / "A.TXT"), payload);
}

TEST_F(MaterializerTest, CreatesSubdirectories) {
    Bytes payload = patternBytes(8, 5);
    writePayload(1, payload);

    Materializer m(m_output, false);
    m.materialize({chunk(1, "DOS/UTIL/X.COM", 1, 0, 8, true, 8)});
    EXPECT_TRUE(std::filesystem::is_directory(m_output / "DOS" / "UTIL"));
    EXPECT_EQ(readBytes(m_output / "DOS" / "UTIL" / "X.COM"), payload);
}

TEST_F(MaterializerTest, ZeroLengthFile) {
    writePayload(1, {});
    Materializer m(m_output, false);
    m.materialize({chunk(1, "EMPTY.TXT", 1, 0, 0, true, 0)});
    EXPECT_TRUE(std::filesystem::exists(m_output / "EMPTY.TXT"));
    EXPECT_EQ(std::filesystem::file_size(m_output / "EMPTY.TXT"), 0u);
}

TEST_F(MaterializerTest, MissingPayloadIsIoFailure) {
    Materializer m(m_output, false);
    try {
        m.copyChunk(chunk(7, "A.TXT", 1, 0, 5, true, 5));
        FAIL() << "expected IoFailure";
    } catch (const RestoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IoFailure);
    }
}

TEST_F(MaterializerTest, ShortPayloadIsIoFailure) {
    writePayload(1, patternBytes(3, 0));
    Materializer m(m_output, false);
    try {
        m.copyChunk(chunk(1, "A.TXT", 1, 0, 5, true, 5));
        FAIL() << "expected IoFailure";
    } catch (const RestoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IoFailure);
    }
}

TEST_F(MaterializerTest, RestoresTimestampAfterLastChunk) {
    writePayload(1, patternBytes(100, 1));
    writePayload(2, patternBytes(150, 2));

    PlannedAction a = chunk(1, "BIG.DAT", 1, 0, 100, false, 250);
    PlannedAction b = chunk(2, "BIG.DAT", 2, 0, 150, true, 250);
    a.timestamp = DosTimestamp(packTime(13, 30, 10), packDate(2000, 6, 15));
    b.timestamp = a.timestamp;

    Materializer m(m_output, true);
    m.materialize({a, b});

    struct stat st{};
    ASSERT_EQ(::stat((m_output / "BIG.DAT").c_str(), &st), 0);
    EXPECT_EQ(st.st_mtime, a.timestamp.toTimeT());
}

TEST_F(MaterializerTest, TimestampsLeftAloneByDefault) {
    writePayload(1, patternBytes(5, 1));
    PlannedAction a = chunk(1, "A.TXT", 1, 0, 5, true, 5);
    a.timestamp = DosTimestamp(packTime(8, 0, 0), packDate(1990, 1, 1));

    Materializer m(m_output, false);
    m.materialize({a});

    struct stat st{};
    ASSERT_EQ(::stat((m_output / "A.TXT").c_str(), &st), 0);
    EXPECT_NE(st.st_mtime, a.timestamp.toTimeT());
}
