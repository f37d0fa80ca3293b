#include <gtest/gtest.h>
#include "dosrestore/Errors.hpp"
#include "dosrestore/VolumeSet.hpp"
#include "BackupFixture.hpp"
#include <vector>

using namespace dosrestore;
using namespace dosrestore::test;

namespace {

class VolumeSetTest : public BackupDirTest {
protected:
    // One volume holding one complete 4-byte file named after the volume.
    void writeSimpleVolume(unsigned seq, bool final) {
        ControlBuilder b;
        b.header(static_cast<uint8_t>(seq), final)
         .directory("\\", 1)
         .file(EntryFields{"F" + std::to_string(seq) + ".TXT", true, 4, 1, 0, 4});
        writeVolume(seq, b, patternBytes(4, static_cast<uint8_t>(seq)));
    }

    template <typename Fn>
    ErrorCode errorOf(Fn fn) {
        try {
            fn();
        } catch (const RestoreError& e) {
            return e.code();
        }
        ADD_FAILURE() << "no RestoreError thrown";
        return ErrorCode::IoFailure;
    }
};

} // namespace

TEST_F(VolumeSetTest, DiscoversControlFilesInNumericOrder) {
    writeBytes(m_source / "CONTROL.010", {});
    writeBytes(m_source / "CONTROL.002", {});
    writeBytes(m_source / "CONTROL.001", {});
    writeBytes(m_source / "CONTROL.01", {});
    writeBytes(m_source / "CONTROL.ABC", {});
    writeBytes(m_source / "BACKUP.001", {});

    auto files = discoverControlFiles(m_source);
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].filename().string(), "CONTROL.001");
    EXPECT_EQ(files[1].filename().string(), "CONTROL.002");
    EXPECT_EQ(files[2].filename().string(), "CONTROL.010");
}

TEST_F(VolumeSetTest, PayloadPathFollowsHeaderSequence) {
    EXPECT_EQ(payloadPathFor(m_source / "CONTROL.001", 7).string(), (m_source / "BACKUP.007").string());
    EXPECT_EQ(payloadPathFor("CONTROL.001", 12).string(), "BACKUP.012");
}

TEST_F(VolumeSetTest, DiscoverModes) {
    writeSimpleVolume(1, false);
    writeSimpleVolume(2, true);

    VolumeSet full = VolumeSet::discover(m_source);
    EXPECT_EQ(full.getMode(), RestoreMode::FullSet);
    ASSERT_EQ(full.getControlFiles().size(), 2u);
    EXPECT_EQ(full.getControlFiles()[1].filename().string(), "CONTROL.002");
    EXPECT_EQ(full.scan().mode, RestoreMode::FullSet);

    VolumeSet one = VolumeSet::single(m_source / "CONTROL.002");
    EXPECT_EQ(one.getMode(), RestoreMode::Incremental);
    ASSERT_EQ(one.getControlFiles().size(), 1u);
    EXPECT_EQ(one.getControlFiles()[0].filename().string(), "CONTROL.002");
    EXPECT_EQ(one.scan().mode, RestoreMode::Incremental);
}

TEST_F(VolumeSetTest, NoControlFiles) {
    EXPECT_EQ(errorOf([&] { VolumeSet::discover(m_source); }), ErrorCode::MissingControlFile);
}

TEST_F(VolumeSetTest, ExplicitControlFileMissing) {
    auto set = VolumeSet::single(m_source / "CONTROL.004");
    EXPECT_EQ(errorOf([&] { set.scan(); }), ErrorCode::MissingControlFile);
}

TEST_F(VolumeSetTest, ConcatenatesVolumesInOrder) {
    writeSimpleVolume(1, false);
    writeSimpleVolume(2, false);
    writeSimpleVolume(3, true);

    ScanResult result = VolumeSet::discover(m_source).scan();
    ASSERT_EQ(result.volumes.size(), 3u);
    ASSERT_EQ(result.actions.size(), 3u);
    EXPECT_EQ(result.actions[0].destination, "F1.TXT");
    EXPECT_EQ(result.actions[2].destination, "F3.TXT");
    EXPECT_EQ(result.actions[2].payload_path, (m_source / "BACKUP.003").string());
    EXPECT_EQ(result.volumes[1].payload_size, 4u);
    EXPECT_TRUE(result.volumes[2].is_final_volume);
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(VolumeSetTest, GapInSequence) {
    writeSimpleVolume(1, false);
    writeSimpleVolume(3, true);
    EXPECT_EQ(errorOf([&] { VolumeSet::discover(m_source).scan(); }),
              ErrorCode::VolumeSequenceError);
}

TEST_F(VolumeSetTest, RepeatedSequence) {
    writeSimpleVolume(1, false);
    ControlBuilder b;
    b.header(1, true).directory("\\", 0);
    writeBytes(m_source / "CONTROL.002", b.bytes());
    EXPECT_EQ(errorOf([&] { VolumeSet::discover(m_source).scan(); }),
              ErrorCode::VolumeSequenceError);
}

TEST_F(VolumeSetTest, FirstVolumeNeedNotBeOne) {
    writeSimpleVolume(4, false);
    writeSimpleVolume(5, true);
    ScanResult result = VolumeSet::discover(m_source).scan();
    EXPECT_EQ(result.volumes.front().sequence_number, 4);
    EXPECT_EQ(result.actions.size(), 2u);
}

TEST_F(VolumeSetTest, MissingPayload) {
    ControlBuilder b;
    b.header(1, true).directory("\\", 0);
    writeBytes(m_source / "CONTROL.001", b.bytes());
    EXPECT_EQ(errorOf([&] { VolumeSet::discover(m_source).scan(); }),
              ErrorCode::MissingPayload);
}

TEST_F(VolumeSetTest, ChunkCheckedAgainstRealPayloadSize) {
    ControlBuilder b;
    b.header(1, true).directory("\\", 1).file(EntryFields{"A.TXT", true, 5, 1, 0, 5});
    writeVolume(1, b, patternBytes(4, 0));
    EXPECT_EQ(errorOf([&] { VolumeSet::discover(m_source).scan(); }),
              ErrorCode::ChunkBeyondPayload);
}

TEST_F(VolumeSetTest, IncrementalIgnoresSequence) {
    writeSimpleVolume(2, false);
    ScanResult result = VolumeSet::single(m_source / "CONTROL.002").scan();
    ASSERT_EQ(result.actions.size(), 1u);
    EXPECT_EQ(result.actions[0].destination, "F2.TXT");
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(VolumeSetTest, WarnsWhenLastVolumeIsNotFinal) {
    writeSimpleVolume(1, false);
    ScanResult result = VolumeSet::discover(m_source).scan();
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("not marked as the last"), std::string::npos);
}

TEST_F(VolumeSetTest, WarnsWhenFinalVolumeIsFollowed) {
    writeSimpleVolume(1, true);
    writeSimpleVolume(2, true);
    ScanResult result = VolumeSet::discover(m_source).scan();
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("more volumes follow"), std::string::npos);
}
