#include <gtest/gtest.h>

#include "Fakes.hpp"
#include "pdftrans/CancellationToken.hpp"
#include "pdftrans/DocumentExtractor.hpp"
#include "pdftrans/TextUtils.hpp"

using namespace pdftrans;
using namespace pdftrans::fakes;

namespace {

FakePageContent textPage(const std::string &text) {
  FakePageContent layout;
  layout.nativeText = text;
  return layout;
}

FakePageContent scannedPage(const std::string &ocrText) {
  FakePageContent layout;
  layout.ocrText = ocrText;
  return layout;
}

const std::string kLongText =
    "This page carries a proper text layer with plenty of characters.";

} // namespace

class DocumentExtractorTest : public ::testing::Test {
protected:
  DocumentExtractorTest()
      : pageExtractor(recognizer), extractor(pageExtractor) {}

  FakeRecognizer recognizer;
  PageExtractor pageExtractor;
  DocumentExtractor extractor;
};

TEST_F(DocumentExtractorTest, FormatPageSection) {
  EXPECT_EQ(formatPageSection(3, "  body \n"), "\n\n===== Page 3 =====\nbody");
  EXPECT_EQ(formatPageSection(1, ""), "\n\n===== Page 1 =====\n");
}

TEST_F(DocumentExtractorTest, JoinsPagesWithMarkersInOrder) {
  FakeDocument document({textPage(kLongText), scannedPage("Scanned words"),
                         textPage("  " + kLongText + "  ")});

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.fullText, "===== Page 1 =====\n" + kLongText +
                                 "\n\n===== Page 2 =====\nScanned words"
                                 "\n\n===== Page 3 =====\n" +
                                 kLongText);
  EXPECT_EQ(result.pageCount, 3);
  EXPECT_EQ(result.ocrPageCount, 1);
  EXPECT_EQ(result.failedPageCount, 0);
  EXPECT_EQ(result.textPageCount, 3);
  ASSERT_EQ(result.pages.size(), 3u);
  EXPECT_FALSE(result.pages[0].usedOcr);
  EXPECT_TRUE(result.pages[1].usedOcr);
}

TEST_F(DocumentExtractorTest, OutputMatchesConcatenationRegardlessOfOcr) {
  std::vector<FakePageContent> pages = {scannedPage("one"), textPage(kLongText),
                                     scannedPage(" "), scannedPage("four")};
  FakeDocument document(pages);

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");
  ASSERT_TRUE(result.success) << result.errorMessage;

  std::string expected = formatPageSection(1, "one") +
                         formatPageSection(2, kLongText) +
                         formatPageSection(3, "") +
                         formatPageSection(4, "four");
  EXPECT_EQ(result.fullText, text::trim(expected));
}

TEST_F(DocumentExtractorTest, BlankPageKeepsItsMarker) {
  FakeDocument document({textPage(kLongText), scannedPage(""),
                         textPage(kLongText)});

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_NE(result.fullText.find("===== Page 2 =====\n\n\n===== Page 3 ====="),
            std::string::npos)
      << result.fullText;
  EXPECT_EQ(result.textPageCount, 2);
}

TEST_F(DocumentExtractorTest, NoTextAnywhereIsExtractionEmpty) {
  FakeDocument document({scannedPage(""), scannedPage("  \n ")});

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::ExtractionEmptyError);
  EXPECT_EQ(result.fullText, "===== Page 1 =====\n\n\n===== Page 2 =====");
  EXPECT_EQ(result.ocrPageCount, 2);
}

TEST_F(DocumentExtractorTest, FailedPageIsIsolatedByDefault) {
  FakePageContent broken;
  broken.failRasterize = true;
  FakePageContent unopenable = textPage(kLongText);
  unopenable.failOpen = true;
  FakeDocument document(
      {textPage(kLongText), broken, unopenable, scannedPage("last page")});

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.failedPageCount, 2);
  EXPECT_EQ(result.fullText, "===== Page 1 =====\n" + kLongText +
                                 "\n\n===== Page 2 =====\n"
                                 "\n\n===== Page 3 =====\n"
                                 "\n\n===== Page 4 =====\nlast page");
  ASSERT_EQ(result.pages.size(), 4u);
  EXPECT_FALSE(result.pages[1].success);
  EXPECT_FALSE(result.pages[2].success);
  EXPECT_EQ(result.pages[2].pageNumber, 3);
}

TEST_F(DocumentExtractorTest, EveryPageFailingIsNotAnEmptyDocument) {
  recognizer.fail = true;
  FakeDocument document(
      {scannedPage("one"), scannedPage("two"), scannedPage("three")});

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::PageExtractionError);
  EXPECT_EQ(result.failedPageCount, 3);
  EXPECT_EQ(result.textPageCount, 0);
  EXPECT_NE(result.errorMessage.find("engine not initialized"),
            std::string::npos)
      << result.errorMessage;
}

TEST_F(DocumentExtractorTest, FailedAndBlankPagesReportTheFailure) {
  FakePageContent broken;
  broken.failRasterize = true;
  FakeDocument document({scannedPage(""), broken});

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");

  EXPECT_EQ(result.errorKind, ErrorKind::PageExtractionError);
  EXPECT_EQ(result.failedPageCount, 1);
}

TEST_F(DocumentExtractorTest, StrictModeAbortsOnFirstFailedPage) {
  extractor.setIsolatePageFailures(false);

  FakePageContent broken;
  broken.failRasterize = true;
  FakeDocument document({textPage(kLongText), broken, textPage(kLongText)});

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::PageExtractionError);
  EXPECT_TRUE(result.fullText.empty()) << "No partial output on abort";
  EXPECT_NE(result.errorMessage.find("page 2"), std::string::npos)
      << result.errorMessage;
  EXPECT_EQ(document.opened, 2) << "Pages after the failure are not read";
}

TEST_F(DocumentExtractorTest, CancelledTokenStopsBeforeNextPage) {
  CancellationToken cancel;
  cancel.cancel();
  FakeDocument document({textPage(kLongText), textPage(kLongText)});

  ExtractionResult result =
      extractor.extractDocument(document, 300, "eng", &cancel);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::CancelledError);
  EXPECT_TRUE(result.fullText.empty());
  EXPECT_EQ(document.opened, 0);
}

TEST_F(DocumentExtractorTest, OnlyOcrPagesAreRendered) {
  FakeDocument document(
      {textPage(kLongText), scannedPage("a"), textPage(kLongText)});

  ExtractionResult result = extractor.extractDocument(document, 300, "eng");

  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(document.rasterizeCalls, 1);
  EXPECT_EQ(recognizer.calls, 1);
}
