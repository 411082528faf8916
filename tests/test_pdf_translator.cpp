#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "PdfBuilder.hpp"
#include "pdftrans/CancellationToken.hpp"
#include "pdftrans/PdfTranslator.hpp"

#include <chrono>
#include <thread>

using namespace pdftrans;
using namespace pdftrans::fakes;

namespace {

const std::string kBody =
    "A page of ordinary text that is long enough to skip OCR entirely.";

FakePageContent textPage(const std::string &text) {
  FakePageContent layout;
  layout.nativeText = text;
  return layout;
}

} // namespace

class PdfTranslatorTest : public ::testing::Test {
protected:
  PdfTranslatorTest() { config.targetLanguage = "de"; }

  PipelineResult run(IDocument &document,
                     PipelineMode mode = PipelineMode::Translate) {
    PdfTranslator pipeline(config, recognizer, translator);
    return pipeline.translateDocument(document, mode);
  }

  PipelineConfig config;
  FakeRecognizer recognizer;
  FakeTranslator translator;
};

TEST_F(PdfTranslatorTest, TranslatesTheMarkedDocument) {
  FakePageContent scanned;
  scanned.ocrText = "scanned words";
  FakeDocument document({textPage(kBody), scanned});

  PipelineResult result = run(document);

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.extractedText, "===== Page 1 =====\n" + kBody +
                                      "\n\n===== Page 2 =====\nscanned words");
  EXPECT_EQ(result.translatedText,
            FakeTranslator::upperCase(result.extractedText).text);
  EXPECT_EQ(result.pageCount, 2);
  EXPECT_EQ(result.ocrPageCount, 1);
  EXPECT_EQ(result.chunkCount, 1);
  EXPECT_EQ(result.requestCount, 1);
  EXPECT_EQ(translator.lastTarget, "de");
  EXPECT_EQ(translator.lastSource, "auto");
  EXPECT_EQ(result.errorKind, ErrorKind::None);
}

TEST_F(PdfTranslatorTest, ExtractOnlySkipsTranslation) {
  FakeDocument document({textPage(kBody)});

  PipelineResult result = run(document, PipelineMode::ExtractOnly);

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.extractedText, "===== Page 1 =====\n" + kBody);
  EXPECT_TRUE(result.translatedText.empty());
  EXPECT_EQ(translator.calls.load(), 0);
}

TEST_F(PdfTranslatorTest, InvalidConfigurationStopsBeforeExtraction) {
  config.maxChunkLength = 0;
  FakeDocument document({textPage(kBody)});

  PipelineResult result = run(document);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::ConfigurationError);
  EXPECT_EQ(document.opened, 0);
  EXPECT_EQ(translator.calls.load(), 0);
}

TEST_F(PdfTranslatorTest, EmptyDocumentIsNotTranslated) {
  FakeDocument document({FakePageContent(), FakePageContent()});

  PipelineResult result = run(document);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::ExtractionEmptyError);
  EXPECT_EQ(translator.calls.load(), 0);
  EXPECT_TRUE(result.translatedText.empty());
}

TEST_F(PdfTranslatorTest, StrictPagesPropagatesPageFailure) {
  config.isolatePageFailures = false;
  FakePageContent broken;
  broken.failRasterize = true;
  FakeDocument document({textPage(kBody), broken});

  PipelineResult result = run(document);

  EXPECT_EQ(result.errorKind, ErrorKind::PageExtractionError);
  EXPECT_EQ(translator.calls.load(), 0);
}

TEST_F(PdfTranslatorTest, TranslationFailureLeavesNoOutput) {
  FakeTranslator failing([](const std::string &) {
    return FakeTranslator::failure("Access denied", false);
  });
  FakeDocument document({textPage(kBody)});
  PdfTranslator pipeline(config, recognizer, failing);

  PipelineResult result = pipeline.translateDocument(document);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::TranslationServiceError);
  EXPECT_TRUE(result.translatedText.empty());
  EXPECT_FALSE(result.extractedText.empty());
}

TEST_F(PdfTranslatorTest, LongDocumentIsChunked) {
  config.maxChunkLength = 100;
  std::vector<FakePageContent> pages(5, textPage(kBody));
  FakeDocument document(pages);

  PipelineResult result = run(document);

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_GT(result.chunkCount, 1);
  EXPECT_EQ(result.translatedText,
            FakeTranslator::upperCase(result.extractedText).text)
      << "Chunks are rejoined with the separators they were split on";
}

TEST_F(PdfTranslatorTest, CancelledRunStops) {
  FakeDocument document({textPage(kBody)});
  CancellationToken cancel;
  cancel.cancel();
  PdfTranslator pipeline(config, recognizer, translator);

  PipelineResult result =
      pipeline.translateDocument(document, PipelineMode::Translate, &cancel);

  EXPECT_EQ(result.errorKind, ErrorKind::CancelledError);
  EXPECT_EQ(translator.calls.load(), 0);
}

TEST_F(PdfTranslatorTest, ConfiguredDeadlineAppliesWithoutToken) {
  config.deadlineSeconds = 0.1;
  config.maxChunkLength = 100;
  FakeTranslator slow([](const std::string &chunk) {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    return FakeTranslator::upperCase(chunk);
  });
  FakeDocument document(std::vector<FakePageContent>(3, textPage(kBody)));
  PdfTranslator pipeline(config, recognizer, slow);

  PipelineResult result = pipeline.translateDocument(document);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::CancelledError);
  EXPECT_NE(result.errorMessage.find("Deadline"), std::string::npos)
      << result.errorMessage;
  EXPECT_EQ(slow.calls.load(), 1) << "Later chunks are not sent";
  EXPECT_TRUE(result.translatedText.empty());
}

TEST_F(PdfTranslatorTest, CallerTokenTakesPrecedenceOverConfiguredDeadline) {
  config.deadlineSeconds = 0.05;
  config.maxChunkLength = 100;
  FakeTranslator slow([](const std::string &chunk) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return FakeTranslator::upperCase(chunk);
  });
  FakeDocument document({textPage(kBody), textPage(kBody)});
  CancellationToken cancel;
  PdfTranslator pipeline(config, recognizer, slow);

  PipelineResult result =
      pipeline.translateDocument(document, PipelineMode::Translate, &cancel);

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.chunkCount, 2);
}

TEST_F(PdfTranslatorTest, UnreadableDataIsInputError) {
  const std::string garbage = "%PDF-garbage";
  PdfTranslator pipeline(config, recognizer, translator);

  PipelineResult result = pipeline.translateData(
      std::vector<char>(garbage.begin(), garbage.end()));

  EXPECT_EQ(result.errorKind, ErrorKind::InputError);
  EXPECT_EQ(translator.calls.load(), 0);
}

TEST_F(PdfTranslatorTest, RealPdfFromMemory) {
  PdfDocument::setBackendDiagnostics(false);
  config.meaningfulTextThreshold = 5;
  PdfTranslator pipeline(config, recognizer, translator);

  PipelineResult result = pipeline.translateData(
      buildPdf({"Hello from page one", "Second page"}));

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.pageCount, 2);
  EXPECT_EQ(result.ocrPageCount, 0);
  EXPECT_NE(result.translatedText.find("HELLO FROM PAGE ONE"),
            std::string::npos)
      << result.translatedText;
  EXPECT_NE(result.translatedText.find("===== PAGE 2 ====="),
            std::string::npos);
}

TEST(PipelineConfigMappingTest, CopiesKnobsToComponents) {
  PipelineConfig config;
  config.ocrLanguage = "deu";
  config.pageSegMode = 6;
  config.preprocessImage = true;
  config.tessDataPath = "/opt/tessdata";
  config.maxChunkLength = 1000;
  config.maxConcurrentRequests = 4;
  config.maxRetries = 2;
  config.sourceLanguage = "en";
  config.apiKey = "secret";
  config.requestTimeoutMs = 1234;

  OCRConfig ocr = makeOCRConfig(config);
  EXPECT_EQ(ocr.language, "deu");
  EXPECT_EQ(ocr.pageSegMode, tesseract::PSM_SINGLE_BLOCK);
  EXPECT_TRUE(ocr.preprocessImage);
  EXPECT_EQ(ocr.tessDataPath, "/opt/tessdata");

  OrchestratorOptions options = makeOrchestratorOptions(config);
  EXPECT_EQ(options.maxChunkLength, 1000u);
  EXPECT_EQ(options.maxConcurrentRequests, 4);
  EXPECT_EQ(options.maxRetries, 2);
  EXPECT_EQ(options.sourceLanguage, "en");

  GoogleTranslatorConfig translator = makeTranslatorConfig(config);
  EXPECT_EQ(translator.apiKey, "secret");
  EXPECT_EQ(translator.timeoutMs, 1234);
}
