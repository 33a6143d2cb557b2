#include "cli/cli_app.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include "cli/cli_args.hpp"
#include "image/image_test_fixation.hpp"
#include "utils/fs/atomic_file.hpp"
#include "utils/utils_test_fixation.hpp"

namespace darkroom {
class CliAppTests : public TempDirTests {
 protected:
  file_path_t config_path_;
  file_path_t photos_;

  void        SetUp() override {
    TempDirTests::SetUp();
    photos_ = dir_ / "photos";
    std::filesystem::create_directories(photos_);
    const nlohmann::json config = {{"store_root", (dir_ / "bucket").string()},
                                   {"manifest_root", (dir_ / "manifests").string()},
                                   {"focal_strategy", "none"},
                                   {"variants",
                                    {{"thumb_width", 40},
                                     {"full_width", 80},
                                     {"preview_width", 120},
                                     {"preview_height", 63}}}};
    config_path_ = dir_ / "darkroom.json";
    WriteFileAtomic(config_path_, config.dump());

    const auto jpeg = EncodeAs(MakeGradient(96, 64), ".jpg");
    WriteFileAtomic(photos_ / "Beach Day.jpg", jpeg.data(), jpeg.size());
  }

  auto Run(std::vector<std::string> args) -> std::string {
    args.push_back("--config");
    args.push_back(config_path_.string());
    std::ostringstream out;
    EXPECT_EQ(RunCli(ParseCliArgs(args), out), 0);
    return out.str();
  }
};

TEST_F(CliAppTests, HelpPrintsUsage) {
  std::ostringstream out;
  EXPECT_EQ(RunCli(ParseCliArgs({}), out), 0);
  EXPECT_NE(out.str().find("usage: darkroom"), std::string::npos);
}

TEST_F(CliAppTests, AlbumListDelete) {
  const auto album = Run({"album", photos_.string(), "beach", "--title", "Beach", "--focal", "tl"});
  EXPECT_NE(album.find("-> beach-day"), std::string::npos);
  EXPECT_NE(album.find("beach: 1 uploaded, 0 resumed, 0 skipped"), std::string::npos);
  EXPECT_NE(album.find("manifest: albums/beach"), std::string::npos);
  EXPECT_TRUE(
      std::filesystem::exists(dir_ / "bucket" / "albums" / "beach" / "og" / "beach-day.jpg"));

  EXPECT_EQ(Run({"list-albums"}), "beach\n");
  EXPECT_NE(Run({"delete-album", "beach"}).find("deleted 4 objects"), std::string::npos);
  EXPECT_EQ(Run({"list-albums"}), "");
}

TEST_F(CliAppTests, AlbumInfoCoverAndPhotoDeletion) {
  const auto jpeg = EncodeAs(MakeGradient(96, 64), ".jpg");
  WriteFileAtomic(photos_ / "Dunes.jpg", jpeg.data(), jpeg.size());
  Run({"album", photos_.string(), "beach", "--title", "Beach", "--date", "2024-07-01"});

  const auto info = Run({"album-info", "beach"});
  EXPECT_NE(info.find("beach: Beach (2024-07-01)"), std::string::npos) << info;
  EXPECT_NE(info.find("cover: beach-day"), std::string::npos) << info;
  EXPECT_NE(info.find("photos: 2"), std::string::npos) << info;

  EXPECT_NE(Run({"set-cover", "beach", "dunes"}).find("cover of beach is now dunes"),
            std::string::npos);
  const auto deleted = Run({"delete-photo", "beach", "dunes"});
  EXPECT_NE(deleted.find("deleted photo dunes (4 objects)"), std::string::npos) << deleted;
  EXPECT_NE(deleted.find("New cover: beach-day"), std::string::npos) << deleted;
  EXPECT_NE(Run({"album-info", "beach"}).find("photos: 1"), std::string::npos);

  std::ostringstream out;
  EXPECT_THROW(RunCli(ParseCliArgs({"album-info", "winter", "--config", config_path_.string()}),
                      out),
               std::runtime_error);
}

TEST_F(CliAppTests, TransferListingAndPurge) {
  EXPECT_NE(Run({"list-transfers"}).find("no active transfers"), std::string::npos);
  Run({"transfer", photos_.string(), "--title", "Proofs", "--id", "proofs", "--expires", "2d"});

  const auto listed = Run({"list-transfers"});
  EXPECT_NE(listed.find("proofs"), std::string::npos) << listed;
  EXPECT_NE(listed.find("expires in 1d 23h"), std::string::npos) << listed;

  const auto info = Run({"transfer-info", "proofs"});
  EXPECT_NE(info.find("proofs: Proofs"), std::string::npos) << info;
  EXPECT_NE(info.find("files: 1"), std::string::npos) << info;
  EXPECT_NE(info.find("Beach Day.jpg"), std::string::npos) << info;

  const auto purged = Run({"delete-all-transfers", "--force"});
  EXPECT_NE(purged.find("and 1 transfer records"), std::string::npos) << purged;
  EXPECT_NE(Run({"list-transfers"}).find("no active transfers"), std::string::npos);
}

TEST_F(CliAppTests, MediaListingAndDeletion) {
  WriteFileAtomic(photos_ / "Pricing.PDF", std::string("%PDF-1.4"));
  Run({"media", photos_.string(), "--asset", "brand"});

  const auto listed = Run({"list-media", "--asset", "brand"});
  EXPECT_NE(listed.find("beach-day.webp"), std::string::npos) << listed;
  EXPECT_NE(listed.find("pricing.pdf"), std::string::npos) << listed;

  EXPECT_NE(Run({"delete-media", "--asset", "brand", "pricing.pdf"})
                .find("deleted assets/brand/pricing.pdf"),
            std::string::npos);
  EXPECT_EQ(Run({"list-media", "--asset", "brand"}).find("pricing.pdf"), std::string::npos);
  EXPECT_NE(Run({"delete-media", "--asset", "brand", "--all"}).find("deleted 1 objects"),
            std::string::npos);
  EXPECT_NE(Run({"list-media", "--asset", "brand"}).find("no files stored under assets/brand/"),
            std::string::npos);
}

TEST_F(CliAppTests, PreviewWritesCard) {
  const auto out_path = dir_ / "card.jpg";
  Run({"preview", (photos_ / "Beach Day.jpg").string(), out_path.string(), "--title", "Beach",
       "--focal", "50,20"});
  const cv::Mat card = cv::imread(out_path.string());
  EXPECT_EQ(card.cols, 120);
  EXPECT_EQ(card.rows, 63);
}

TEST_F(CliAppTests, UnknownFocalIsRejected) {
  std::ostringstream out;
  const auto         options = ParseCliArgs({"album", photos_.string(), "beach", "--title", "B",
                                             "--focal", "sideways", "--config",
                                             config_path_.string()});
  EXPECT_THROW(RunCli(options, out), std::invalid_argument);
}
}  // namespace darkroom
