#include "test_helpers.hpp"
#include <transfer/transfer_engine.hpp>
#include <transfer/integrity_verifier.hpp>

class TransferEngineTest : public ScratchTest {};

TEST_F(TransferEngineTest, CopiesContentAcrossChunks) {
    std::string content;
    for (int i = 0; i < 1000; ++i) content += static_cast<char>(i % 251);
    auto src = write_file("in/data.bin", content);

    TransferEngine engine(64);
    std::vector<uint64_t> chunks;
    auto copied = engine.copy(src, test_dir / "out/deep/data.bin",
                              [&](uint64_t n) { chunks.push_back(n); });

    ASSERT_TRUE(copied.is_ok()) << copied.error;
    EXPECT_EQ(copied.value, 1000u);
    EXPECT_EQ(read_file(test_dir / "out/deep/data.bin"), content);

    // 15 full chunks and one of 40
    ASSERT_EQ(chunks.size(), 16u);
    EXPECT_EQ(chunks.front(), 64u);
    EXPECT_EQ(chunks.back(), 40u);
}

TEST_F(TransferEngineTest, EmptyFile) {
    auto src = write_file("empty.txt");
    TransferEngine engine(4096);
    auto copied = engine.copy(src, test_dir / "copy.txt");
    ASSERT_TRUE(copied.is_ok());
    EXPECT_EQ(copied.value, 0u);
    EXPECT_TRUE(fs::exists(test_dir / "copy.txt"));
}

TEST_F(TransferEngineTest, MissingSourceIsIoFailure) {
    TransferEngine engine(4096);
    auto copied = engine.copy(test_dir / "absent.bin", test_dir / "copy.bin");
    ASSERT_TRUE(copied.is_err());
    EXPECT_EQ(copied.kind, ErrorKind::IoFailure);
    EXPECT_FALSE(fs::exists(test_dir / "copy.bin"));
}

TEST_F(TransferEngineTest, OverwritesExistingDestination) {
    auto src = write_file("a.txt", "short");
    write_file("b.txt", "a much longer previous content");
    TransferEngine engine(4096);
    ASSERT_TRUE(engine.copy(src, test_dir / "b.txt").is_ok());
    EXPECT_EQ(read_file(test_dir / "b.txt"), "short");
}

TEST_F(TransferEngineTest, RefusesToCopyOntoItself) {
    auto src = write_file("a.txt", "keep me");
    TransferEngine engine(4096);
    auto copied = engine.copy(src, src);
    ASSERT_TRUE(copied.is_err());
    EXPECT_EQ(copied.kind, ErrorKind::InvalidInput);
    EXPECT_EQ(read_file(src), "keep me");
}

TEST_F(TransferEngineTest, DigestKnownValues) {
    IntegrityVerifier verifier(2);
    auto abc = verifier.digest(write_file("abc.txt", "abc"));
    ASSERT_TRUE(abc.is_ok());
    EXPECT_EQ(abc.value, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto empty = verifier.digest(write_file("empty.txt"));
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(TransferEngineTest, VerifyMatchAndMismatch) {
    IntegrityVerifier verifier(8);
    auto a = write_file("a.txt", "same bytes here");
    auto b = write_file("b.txt", "same bytes here");
    auto c = write_file("c.txt", "same bytes HERE");

    auto same = verifier.verify(a, b);
    ASSERT_TRUE(same.is_ok());
    EXPECT_TRUE(same.value);

    // A mismatch is a value, not an error
    auto differs = verifier.verify(a, c);
    ASSERT_TRUE(differs.is_ok());
    EXPECT_FALSE(differs.value);
}

TEST_F(TransferEngineTest, VerifyMissingFileIsIoFailure) {
    IntegrityVerifier verifier(8);
    auto a = write_file("a.txt", "x");
    auto r = verifier.verify(a, test_dir / "gone.txt");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::IoFailure);
}

TEST_F(TransferEngineTest, CopyThenVerifyRoundTrip) {
    std::string content(10000, 'z');
    content[5000] = 'q';
    auto src = write_file("src.bin", content);

    TransferEngine engine(1024);
    IntegrityVerifier verifier(1024);
    ASSERT_TRUE(engine.copy(src, test_dir / "dst.bin").is_ok());

    EXPECT_EQ(fs::file_size(test_dir / "dst.bin"), content.size());
    auto same = verifier.verify(src, test_dir / "dst.bin");
    ASSERT_TRUE(same.is_ok());
    EXPECT_TRUE(same.value);
}
