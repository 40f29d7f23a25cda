#include "test_helpers.hpp"
#include <transfer/job_policy.hpp>
#include <transfer/kind_policies.hpp>
#include <history/history_log.hpp>
#include <set>

TEST(NamingTemplate, IndexNameExt) {
    EXPECT_EQ(apply_naming_template("{index}_{name}.{ext}", "photo.jpg", 0), "001_photo.jpg");
    EXPECT_EQ(apply_naming_template("{index}_{name}.{ext}", "photo.jpg", 9), "010_photo.jpg");
    EXPECT_EQ(apply_naming_template("{name}_final.{ext}", "document.pdf", 0), "document_final.pdf");
    EXPECT_EQ(apply_naming_template("image_{index}.{ext}", "test.png", 99), "image_100.png");
    EXPECT_EQ(apply_naming_template("{name}_{index}", "photo.jpg", 5), "photo_006");
}

TEST(NamingTemplate, NoExtension) {
    EXPECT_EQ(apply_naming_template("{index}_{name}", "file", 5), "006_file");
}

TEST(NamingTemplate, RepeatedPlaceholders) {
    EXPECT_EQ(apply_naming_template("{name}-{name}.{ext}", "a.b.c", 0), "a.b-a.b.c");
    EXPECT_EQ(apply_naming_template("{index}{index}", "x", 1000), "10011001");
}

TEST(MediaCategory, ByExtension) {
    EXPECT_EQ(classify_media("IMG_0001.JPG"), MediaCategory::Photo);
    EXPECT_EQ(classify_media("raw/DSC01.arw"), MediaCategory::Photo);
    EXPECT_EQ(classify_media("clip.MOV"), MediaCategory::Video);
    EXPECT_EQ(classify_media("a.m2ts"), MediaCategory::Video);
    EXPECT_EQ(classify_media("notes.txt"), MediaCategory::Other);
    EXPECT_EQ(classify_media("README"), MediaCategory::Other);
}

TEST(FolderName, IgnoresTrailingSeparator) {
    EXPECT_EQ(folder_name("/data/shoot/").string(), "shoot");
    EXPECT_EQ(folder_name("/data/shoot").string(), "shoot");
}

TEST(PlainFileName, RejectsSeparatorsAndDots) {
    EXPECT_TRUE(is_plain_file_name("001_photo.jpg"));
    EXPECT_TRUE(is_plain_file_name("..hidden"));
    EXPECT_FALSE(is_plain_file_name(""));
    EXPECT_FALSE(is_plain_file_name("."));
    EXPECT_FALSE(is_plain_file_name(".."));
    EXPECT_FALSE(is_plain_file_name("../x.jpg"));
    EXPECT_FALSE(is_plain_file_name("a/b.jpg"));
    EXPECT_FALSE(is_plain_file_name("a\\b.jpg"));
}

class WithinTest : public ScratchTest {};

TEST_F(WithinTest, FollowsDotDotAndMissingTails) {
    write_file("proj/a.txt", "1");
    auto proj = test_dir / "proj";

    EXPECT_TRUE(is_within(proj, proj));
    EXPECT_TRUE(is_within(test_dir / "proj/", proj));
    EXPECT_TRUE(is_within(proj / "not/yet/made", proj));
    EXPECT_TRUE(is_within(test_dir / "other/../proj/x", proj));
    EXPECT_FALSE(is_within(test_dir / "proj2", proj));
    EXPECT_FALSE(is_within(test_dir / "proj/../cold", proj));
    EXPECT_FALSE(is_within(test_dir, proj));
}

class PolicyTest : public ScratchTest {
protected:
    Job job_for(JobKind kind, std::vector<std::string> sources, const std::string& dest) {
        Job job;
        job.id = "job-1";
        job.kind = kind;
        job.project_id = "p1";
        job.project_name = "Wedding";
        job.sources = std::move(sources);
        job.destination = dest;
        return job;
    }
};

TEST_F(PolicyTest, BackupMirrorsUnderSourceFolderName) {
    write_file("shoot/a.jpg", "aa");
    write_file("shoot/day2/b.mov", "bbbb");
    auto loose = write_file("notes.txt", "n");

    HistoryLog history(test_dir / "h.yaml", 100);
    BackupPolicy policy(history);
    auto dest = test_dir / "backup";
    auto units = policy.enumerate(job_for(JobKind::Backup,
        {(test_dir / "shoot").string(), loose.string()}, dest.string()));

    ASSERT_TRUE(units.is_ok()) << units.error;
    ASSERT_EQ(units.value.size(), 3u);
    EXPECT_EQ(units.value[0].dest.string(), (dest / "shoot" / "a.jpg").string());
    EXPECT_EQ(units.value[1].dest.string(), (dest / "shoot" / "day2" / "b.mov").string());
    EXPECT_EQ(units.value[1].size, 4u);
    EXPECT_EQ(units.value[2].dest.string(), (dest / "notes.txt").string());
    EXPECT_EQ(policy.on_unit_failure(), FailureAction::Skip);
    EXPECT_FALSE(policy.parallel());
}

TEST_F(PolicyTest, DeliveryAppliesTemplate) {
    auto a = write_file("sel/sunset.jpg", "1");
    auto b = write_file("sel/toast.mp4", "22");

    DeliveryPolicy policy;
    auto job = job_for(JobKind::Delivery, {a.string(), b.string()}, (test_dir / "out").string());
    job.options.naming_template = "{index}_{name}.{ext}";

    auto units = policy.enumerate(job);
    ASSERT_TRUE(units.is_ok()) << units.error;
    ASSERT_EQ(units.value.size(), 2u);
    EXPECT_EQ(units.value[0].dest.filename().string(), "001_sunset.jpg");
    EXPECT_EQ(units.value[1].dest.filename().string(), "002_toast.mp4");
    EXPECT_EQ(policy.on_unit_failure(), FailureAction::Abort);
}

TEST_F(PolicyTest, DeliveryRejectsFolders) {
    write_file("sel/a.jpg", "1");
    DeliveryPolicy policy;
    JobRequest req;
    req.kind = JobKind::Delivery;
    req.sources = {(test_dir / "sel").string()};
    req.destination = (test_dir / "out").string();
    auto r = policy.validate(req);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
}

TEST_F(PolicyTest, ArchiveValidation) {
    write_file("proj/a.txt", "1");
    MemoryProjectRegistry projects;
    ArchivePolicy policy(projects);

    JobRequest req;
    req.kind = JobKind::Archive;
    req.sources = {(test_dir / "proj").string()};
    req.destination = (test_dir / "cold").string();
    EXPECT_TRUE(policy.validate(req).is_ok());

    req.options.compress = true;
    auto compressed = policy.validate(req);
    ASSERT_TRUE(compressed.is_err());
    EXPECT_EQ(compressed.kind, ErrorKind::Unimplemented);

    req.options.compress = false;
    req.sources = {(test_dir / "proj/a.txt").string()};
    EXPECT_EQ(policy.validate(req).kind, ErrorKind::InvalidInput);

    req.sources = {};
    EXPECT_EQ(policy.validate(req).kind, ErrorKind::InvalidInput);
}

TEST_F(PolicyTest, ArchiveRefusesOverlappingDestination) {
    write_file("proj/a.txt", "1");
    MemoryProjectRegistry projects;
    ArchivePolicy policy(projects);

    JobRequest req;
    req.kind = JobKind::Archive;
    req.sources = {(test_dir / "proj").string()};

    req.destination = (test_dir / "proj/cold").string();
    EXPECT_EQ(policy.validate(req).kind, ErrorKind::InvalidInput);

    // target is <scratch>/proj, the source itself
    req.destination = test_dir.string();
    EXPECT_EQ(policy.validate(req).kind, ErrorKind::InvalidInput);

    // named after the project the target no longer collides
    req.project_name = "Wedding";
    EXPECT_TRUE(policy.validate(req).is_ok());

    req.project_name = "../proj";
    EXPECT_EQ(policy.validate(req).kind, ErrorKind::InvalidInput);
}

TEST_F(PolicyTest, ArchiveUsesProjectName) {
    write_file("proj/raw/a.cr2", "1");
    MemoryProjectRegistry projects;
    ArchivePolicy policy(projects);
    auto dest = test_dir / "cold";

    auto units = policy.enumerate(job_for(JobKind::Archive, {(test_dir / "proj").string()}, dest.string()));
    ASSERT_TRUE(units.is_ok());
    ASSERT_EQ(units.value.size(), 1u);
    EXPECT_EQ(units.value[0].dest.string(), (dest / "Wedding" / "raw" / "a.cr2").string());
}

TEST_F(PolicyTest, ImportRoutesByMediaType) {
    write_file("card/DCIM/100/IMG_1.JPG", "p");
    write_file("card/DCIM/100/CLIP_1.MP4", "vv");
    write_file("card/MISC/info.xml", "x");

    HistoryLog history(test_dir / "h.yaml", 100);
    ImportPolicy policy(history);
    auto dest = test_dir / "ingest";
    auto units = policy.enumerate(job_for(JobKind::Import, {(test_dir / "card").string()}, dest.string()));

    ASSERT_TRUE(units.is_ok()) << units.error;
    ASSERT_EQ(units.value.size(), 3u);

    std::map<std::string, fs::path> by_name;
    for (const auto& u : units.value) by_name[u.display_name] = u.dest;
    EXPECT_EQ(by_name["IMG_1.JPG"].string(), (dest / "Photos" / "IMG_1.JPG").string());
    EXPECT_EQ(by_name["CLIP_1.MP4"].string(), (dest / "Videos" / "CLIP_1.MP4").string());
    EXPECT_EQ(by_name["info.xml"].string(), (dest / "info.xml").string());
    EXPECT_TRUE(policy.parallel());
    EXPECT_EQ(policy.on_unit_failure(), FailureAction::Skip);
}

TEST_F(PolicyTest, ImportSuffixesClashingNames) {
    write_file("card/DCIM/100/IMG_1.JPG", "a");
    write_file("card/DCIM/101/IMG_1.JPG", "b");
    write_file("card/DCIM/102/IMG_1.JPG", "c");
    write_file("card/DCIM/102/IMG_1.MP4", "v");

    HistoryLog history(test_dir / "h.yaml", 100);
    ImportPolicy policy(history);
    auto dest = test_dir / "ingest";
    auto units = policy.enumerate(job_for(JobKind::Import, {(test_dir / "card").string()}, dest.string()));

    ASSERT_TRUE(units.is_ok()) << units.error;
    ASSERT_EQ(units.value.size(), 4u);
    std::set<std::string> dests;
    for (const auto& u : units.value) dests.insert(u.dest.string());
    EXPECT_EQ(dests.size(), 4u);
    EXPECT_TRUE(dests.count((dest / "Photos" / "IMG_1.JPG").string()));
    EXPECT_TRUE(dests.count((dest / "Photos" / "IMG_1_1.JPG").string()));
    EXPECT_TRUE(dests.count((dest / "Photos" / "IMG_1_2.JPG").string()));
    EXPECT_TRUE(dests.count((dest / "Videos" / "IMG_1.MP4").string()));
}
