#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/extractors/email_extractor.hpp"
#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/extractors/plaintext_extractor.hpp"
#include "docqa_core/extractors/spreadsheet_extractor.hpp"
#include "utilities_test.hpp"

namespace docqa_core {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

class ContentExtractorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = docqa_tests::TestUtilities::create_temp_dir("docqa_extractor_tests");
  }

  void TearDown() override {
    docqa_tests::TestUtilities::cleanup_temp_dir(test_dir_);
  }

  std::filesystem::path create_test_file(const std::string& filename, const std::string& content) {
    return docqa_tests::TestUtilities::write_file(test_dir_, filename, content);
  }

  std::filesystem::path test_dir_;
};

TEST_F(ContentExtractorTest, PlainTextExtractsContent) {
  PlainTextExtractor extractor;
  auto path = create_test_file("leave_policy.txt", "Employees accrue 20 days of annual leave.\n");

  auto result = extractor.extract(path);

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.content, "Employees accrue 20 days of annual leave.\n");
  EXPECT_EQ(result.file_name, "leave_policy.txt");
  EXPECT_EQ(result.file_type, FileType::Text);
  EXPECT_EQ(result.to_document_text(), result.content);
}

TEST_F(ContentExtractorTest, BlankFileIsReportedEmpty) {
  PlainTextExtractor extractor;
  auto path = create_test_file("blank.txt", "   \n\t\n");

  auto result = extractor.extract(path);

  EXPECT_EQ(result.status, ExtractionStatus::Empty);
  EXPECT_EQ(result.to_document_text(), "[EMPTY CONTENT: blank.txt]");
}

TEST_F(ContentExtractorTest, PlainTextHandlesLegacyEncoding) {
  PlainTextExtractor extractor;
  auto path = create_test_file("notes.txt", std::string("Caf") + static_cast<char>(0xE9));

  auto result = extractor.extract(path);

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.content, "Caf\xC3\xA9");
}

TEST_F(ContentExtractorTest, MarkdownStripsMarkupButKeepsText) {
  MarkdownExtractor extractor;
  auto path = create_test_file("guide.md",
                               "---\ntitle: Guide\n---\n"
                               "# Leave Policy\n\n"
                               "Read the **full** [handbook](https://intranet/handbook).\n"
                               "<!-- internal note -->\n"
                               "```\ncode sample\n```\n");

  auto result = extractor.extract(path);

  ASSERT_TRUE(result.ok());
  EXPECT_THAT(result.content, HasSubstr("Leave Policy"));
  EXPECT_THAT(result.content, HasSubstr("Read the full handbook."));
  EXPECT_THAT(result.content, HasSubstr("code sample"));
  EXPECT_THAT(result.content, Not(HasSubstr("title: Guide")));
  EXPECT_THAT(result.content, Not(HasSubstr("internal note")));
  EXPECT_THAT(result.content, Not(HasSubstr("```")));
  EXPECT_THAT(result.content, Not(HasSubstr("# ")));
  EXPECT_EQ(result.file_type, FileType::Markdown);
}

TEST_F(ContentExtractorTest, CsvRowsBecomeLabelledLines) {
  SpreadsheetExtractor extractor;
  auto path = create_test_file("holidays.csv",
                               "Holiday,Date,Notes\n"
                               "New Year,2024-01-01,\"Office closed, all sites\"\n"
                               "Labor Day,2024-09-02,\n");

  auto result = extractor.extract(path);

  ASSERT_TRUE(result.ok());
  EXPECT_THAT(result.content, StartsWith("Sheet: holidays"));
  EXPECT_THAT(result.content, HasSubstr("Holiday: New Year | Date: 2024-01-01 | Notes: Office closed, all sites"));
  EXPECT_THAT(result.content, HasSubstr("Holiday: Labor Day | Date: 2024-09-02"));
  EXPECT_EQ(result.file_type, FileType::Spreadsheet);
}

TEST_F(ContentExtractorTest, DelimitedParserHandlesQuotesAndNewlines) {
  auto rows = SpreadsheetExtractor::parse_delimited("a,\"b \"\"quoted\"\"\",\"multi\nline\"\n1,2,3", ',');

  ASSERT_EQ(rows.size(), 2u);
  ASSERT_EQ(rows[0].size(), 3u);
  EXPECT_EQ(rows[0][1], "b \"quoted\"");
  EXPECT_EQ(rows[0][2], "multi\nline");
  EXPECT_EQ(rows[1][2], "3");
}

TEST_F(ContentExtractorTest, ColumnIndexFromCellReference) {
  EXPECT_EQ(SpreadsheetExtractor::column_index("A1"), 0u);
  EXPECT_EQ(SpreadsheetExtractor::column_index("B7"), 1u);
  EXPECT_EQ(SpreadsheetExtractor::column_index("AA3"), 26u);
}

TEST_F(ContentExtractorTest, EmailExtractsHeadersBodyAndAttachmentNames) {
  EmailExtractor extractor;
  auto path = create_test_file(
      "benefits.eml",
      "From: HR Team <hr@example.com>\r\n"
      "To: all@example.com\r\n"
      "Subject: =?utf-8?B?QmVuZWZpdHMgdXBkYXRl?=\r\n"
      "MIME-Version: 1.0\r\n"
      "Content-Type: multipart/mixed; boundary=\"XYZ\"\r\n"
      "\r\n"
      "--XYZ\r\n"
      "Content-Type: text/plain; charset=utf-8\r\n"
      "Content-Transfer-Encoding: quoted-printable\r\n"
      "\r\n"
      "Dental coverage now starts on day one=2E\r\n"
      "--XYZ\r\n"
      "Content-Type: application/pdf; name=\"plan.pdf\"\r\n"
      "Content-Disposition: attachment; filename=\"plan.pdf\"\r\n"
      "Content-Transfer-Encoding: base64\r\n"
      "\r\n"
      "JVBERi0=\r\n"
      "--XYZ--\r\n");

  auto result = extractor.extract(path);

  ASSERT_TRUE(result.ok()) << result.error_message;
  EXPECT_THAT(result.content, HasSubstr("Subject: Benefits update"));
  EXPECT_THAT(result.content, HasSubstr("From: HR Team <hr@example.com>"));
  EXPECT_THAT(result.content, HasSubstr("Dental coverage now starts on day one."));
  EXPECT_THAT(result.content, HasSubstr("Attachments: plan.pdf"));
  EXPECT_EQ(result.file_type, FileType::Email);
}

TEST_F(ContentExtractorTest, EmailDecodingHelpers) {
  EXPECT_EQ(EmailExtractor::decode_base64("SGVsbG8="), "Hello");
  EXPECT_EQ(EmailExtractor::decode_quoted_printable("caf=C3=A9 =\nsoft"), "caf\xC3\xA9 soft");
  EXPECT_EQ(EmailExtractor::strip_html("<p>Hello <b>team</b></p>"), "Hello team");
}

TEST_F(ContentExtractorTest, HtmlTagsAndWhitespaceAreNormalized) {
  EXPECT_EQ(EmailExtractor::strip_html("<P CLASS=\"x\">Line one<BR/>line   two</P>\n\n\n<h2>Next</h2>"
                                       "<STYLE>p { color: red; }</STYLE>a &amp; b"),
            "Line one\nline two\n\nNext\n\na & b");
  EXPECT_EQ(EmailExtractor::strip_html("1 < 2"), "1 < 2");
}

TEST_F(ContentExtractorTest, LargeInlineScriptIsRemovedWithoutRecursion) {
  const std::string html = "<p>Intro</p><script type=\"text/javascript\">" + std::string(300000, 'x') +
                           "</script><p>Outro</p>";
  EXPECT_EQ(EmailExtractor::strip_html(html), "Intro\n\nOutro");

  const std::string unclosed_tag = "Before <" + std::string(300000, 'y');
  EXPECT_EQ(EmailExtractor::strip_html(unclosed_tag).size(), unclosed_tag.size());
}

TEST_F(ContentExtractorTest, LargeMarkdownWithFrontMatterAndCommentsIsStripped) {
  std::string body;
  while (body.size() < 300000) {
    body += "Employees accrue **annual** leave monthly, see [policy](https://intranet/leave).\n\n";
  }

  const std::string with_front_matter = MarkdownExtractor::strip_markup("---\ntitle: Leave\n---\n" + body);
  EXPECT_THAT(with_front_matter, StartsWith("Employees accrue annual leave monthly, see policy."));
  EXPECT_THAT(with_front_matter, Not(HasSubstr("title: Leave")));

  // A leading rule without a closing one is ordinary text.
  EXPECT_THAT(MarkdownExtractor::strip_markup("---\n" + body), StartsWith("---\nEmployees"));

  const std::string unterminated_comment = MarkdownExtractor::strip_markup("Intro\n<!-- draft\n" + body);
  EXPECT_THAT(unterminated_comment, StartsWith("Intro\n<!-- draft\n"));

  const std::string closed_comment = MarkdownExtractor::strip_markup("<!--" + body + "-->Tail");
  EXPECT_EQ(closed_comment, "Tail");
}

TEST_F(ContentExtractorTest, LongMarkdownLineWithUnclosedMarkersIsKept) {
  const std::string line = "**[" + std::string(300000, 'z');
  EXPECT_EQ(MarkdownExtractor::strip_markup(line), line);
}

TEST_F(ContentExtractorTest, FactoryPicksExtractorByExtension) {
  ContentExtractorFactory factory;

  EXPECT_EQ(factory.get_extractor_for("a.md").get_file_type(), FileType::Markdown);
  EXPECT_EQ(factory.get_extractor_for("a.MARKDOWN").get_file_type(), FileType::Markdown);
  EXPECT_EQ(factory.get_extractor_for("a.csv").get_file_type(), FileType::Spreadsheet);
  EXPECT_EQ(factory.get_extractor_for("a.pdf").get_file_type(), FileType::PDF);
  EXPECT_EQ(factory.get_extractor_for("a.docx").get_file_type(), FileType::Word);
  EXPECT_EQ(factory.get_extractor_for("a.pptx").get_file_type(), FileType::Presentation);
  EXPECT_EQ(factory.get_extractor_for("a.png").get_file_type(), FileType::Image);
  EXPECT_EQ(factory.get_extractor_for("a.eml").get_file_type(), FileType::Email);
  // Unknown extensions fall back to plain text.
  EXPECT_EQ(factory.get_extractor_for("a.unknown").get_file_type(), FileType::Text);
}

TEST_F(ContentExtractorTest, FactoryReportsMissingFileWithFullPath) {
  ContentExtractorFactory factory;
  auto missing = test_dir_ / "missing.txt";

  auto result = factory.extract(missing);

  EXPECT_EQ(result.status, ExtractionStatus::NotFound);
  EXPECT_EQ(result.to_document_text(), "[FILE NOT FOUND: " + missing.string() + "]");
}

TEST_F(ContentExtractorTest, FactoryRejectsOversizedFiles) {
  ExtractorOptions options;
  options.max_file_size_bytes = 10;
  ContentExtractorFactory factory(options);
  auto path = create_test_file("big.txt", "this text is longer than ten bytes");

  auto result = factory.extract(path);

  EXPECT_EQ(result.status, ExtractionStatus::TooLarge);
  EXPECT_THAT(result.to_document_text(), StartsWith("[FILE TOO LARGE: big.txt]"));
}

TEST_F(ContentExtractorTest, UnreadablePdfNeverThrows) {
  ContentExtractorFactory factory;
  auto path = create_test_file("broken.pdf", "not really a pdf");

  ExtractionResult result;
  EXPECT_NO_THROW(result = factory.extract(path));
  EXPECT_FALSE(result.ok());
  EXPECT_THAT(result.to_document_text(), StartsWith("["));
  EXPECT_THAT(result.to_document_text(), HasSubstr("broken.pdf"));
}

}  // namespace docqa_core
