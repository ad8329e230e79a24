#include <gtest/gtest.h>
#include "cleanocr.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
// Stands in for a real OCR engine: every variant reads as the same text.
class FixedExtractor : public TextExtractor {
public:
    explicit FixedExtractor(std::string text) : text_(std::move(text)) {}
    std::string Extract(const cv::Mat& image, const std::string&) override {
        if (image.empty()) throw CapabilityCallFailure("empty raster");
        return text_;
    }
    std::string Name() const override { return "fixed"; }

private:
    std::string text_;
};

class CleanOcrTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "cleanocr_test";
        fs::create_directories(dir_);
        image_path_ = (dir_ / "page.png").string();
        cv::Mat page(80, 200, CV_8UC3, cv::Scalar(255, 255, 255));
        cv::putText(page, "3", cv::Point(20, 60), cv::FONT_HERSHEY_SIMPLEX, 1.5, cv::Scalar(0, 0, 0), 2);
        ASSERT_TRUE(cv::imwrite(image_path_, page));
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    CleanOCR MakeApp(const std::string& text, bool with_pipeline = true) {
        CorrectionConfig config;
        config.enable_grammar = false;
        config.enable_spelling = false;
        return CleanOCR(std::make_unique<FixedExtractor>(text),
                        with_pipeline ? std::make_unique<CorrectionPipeline>(config) : nullptr);
    }

    fs::path dir_;
    std::string image_path_;
};
}

TEST_F(CleanOcrTest, ProcessesImageEndToEnd) {
    CleanOCR app = MakeApp("  Привет 3 3ажигалка \n");
    ProcessResult result = app.Process(image_path_);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.full_text, "Привет 3 3ажигалка");
    EXPECT_EQ(result.best_variant, "grayscale");
    EXPECT_EQ(result.statistics.characters, 18u);
    EXPECT_EQ(result.statistics.words, 3u);

    EXPECT_TRUE(result.checked);
    EXPECT_EQ(result.error_count, result.errors.size());
    EXPECT_EQ(result.error_types[IssueKind::ConfusableChar], 2u);
    EXPECT_NE(result.corrected_text.find("Зажигалка"), std::string::npos);
}

TEST_F(CleanOcrTest, SkipsCorrectionWhenNotRequested) {
    CleanOCR app = MakeApp("3амок");
    ProcessOptions options;
    options.check_errors = false;
    ProcessResult result = app.Process(image_path_, options);

    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.checked);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.error_count, 0u);
    EXPECT_TRUE(result.corrected_text.empty());
}

TEST_F(CleanOcrTest, NoPipelineMeansNoCheck) {
    CleanOCR app = MakeApp("3амок", false);
    ProcessResult result = app.Process(image_path_);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.checked);
    EXPECT_EQ(app.Pipeline(), nullptr);
}

TEST_F(CleanOcrTest, MissingFileFailsWithoutThrowing) {
    CleanOCR app = MakeApp("текст");
    ProcessResult result = app.Process((dir_ / "missing.png").string());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("not found"), std::string::npos);
    EXPECT_TRUE(result.full_text.empty());

    EXPECT_THROW(app.Recognize((dir_ / "missing.png").string()), NotFoundError);
}

TEST_F(CleanOcrTest, UnreachablePathFailsWithoutThrowing) {
    fs::create_symlink(dir_ / "loopB", dir_ / "loopA");
    fs::create_symlink(dir_ / "loopA", dir_ / "loopB");
    const std::string looped = (dir_ / "loopA" / "page.png").string();

    CleanOCR app = MakeApp("текст");
    ProcessResult result;
    EXPECT_NO_THROW(result = app.Process(looped));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
    EXPECT_THROW(app.Recognize(looped), NotFoundError);

    // The rest of a batch still goes through.
    EXPECT_TRUE(app.Process(image_path_).success);
}

TEST_F(CleanOcrTest, UndecodableFileFails) {
    const fs::path junk = dir_ / "junk.png";
    {
        std::ofstream out(junk, std::ios::binary);
        out << "definitely not a png";
    }
    CleanOCR app = MakeApp("текст");
    ProcessResult result = app.Process(junk.string());
    EXPECT_FALSE(result.success);
    EXPECT_THROW(app.Recognize(junk.string()), DecodeError);
}

TEST_F(CleanOcrTest, EmptyRecognitionStillSucceeds) {
    CleanOCR app = MakeApp("   ");
    ProcessResult result = app.Process(image_path_);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.full_text.empty());
    EXPECT_EQ(result.statistics.characters, 0u);
    EXPECT_EQ(result.statistics.words, 0u);
    EXPECT_EQ(result.error_count, 0u);
}

TEST_F(CleanOcrTest, SaveResultWritesTextFile) {
    const fs::path out_dir = dir_ / "out";
    std::string saved = SaveResult("распознанный текст", image_path_, out_dir.string());
    EXPECT_EQ(fs::path(saved), out_dir / "page.txt");

    std::ifstream in(saved, std::ios::binary);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "распознанный текст");

    std::string beside = SaveResult("x", image_path_, "");
    EXPECT_EQ(fs::path(beside), dir_ / "page.txt");
}

TEST(CleanOcrConstructionTest, RequiresExtractor) {
    EXPECT_THROW(CleanOCR(nullptr, nullptr), std::invalid_argument);
}

TEST(ComputeStatisticsTest, CountsCodePointsAndWords) {
    TextStatistics stats = ComputeStatistics("один два\nтри");
    EXPECT_EQ(stats.characters, 12u);
    EXPECT_EQ(stats.words, 3u);
}
