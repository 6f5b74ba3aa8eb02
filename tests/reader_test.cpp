#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <fwio.hpp>
#include <fwio/fwio_utils.hpp>

using fwio::ErrorCode;
using fwio::Layout;
using fwio::LayoutBuilder;
using fwio::LineEnding;
using fwio::Record;
using fwio::RecordReader;
using fwio::io::StringSource;

namespace {

RecordReader<StringSource> make_reader(const std::string& text, Layout layout) {
    return RecordReader<StringSource>(StringSource(text), std::move(layout));
}

Layout people_layout() {
    return LayoutBuilder()
        .fields({7, 4})
        .skip_start(2)
        .skip_lines(1)
        .comment('#')
        .line_ending(LineEnding::lf)
        .trim()
        .build();
}

} // namespace

// =============================================================================
// Header, comments and trimming
// =============================================================================

TEST(RecordReaderTest, SkipsHeaderAndCommentBeforeFirstRecord) {
    auto reader = make_reader("header\n# comment\n  John   1245\n", people_layout());

    auto result = reader.read();

    ASSERT_TRUE(result.is_valid()) << result.error.message();
    EXPECT_EQ(result.fields, (Record{"John", "1245"}));
    EXPECT_TRUE(reader.header_skipped());
    EXPECT_EQ(reader.lines_read(), 3);
    EXPECT_EQ(reader.records_read(), 1);
}

TEST(RecordReaderTest, ReadAllPeopleFile) {
    const std::string input = "This is a header line to be skipped\n"
                              "# The following is info for the men\n"
                              "  John   1245\n"
                              "  Peter  3545\n"
                              "# The following is info for certain women\n"
                              "  Susan  6784\n"
                              "  Sarah  4321\n";
    auto reader = make_reader(input, people_layout());

    auto result = reader.read_all();

    ASSERT_TRUE(result.is_valid()) << result.error.message();
    ASSERT_EQ(result.records.size(), 4);
    EXPECT_EQ(result.records[0], (Record{"John", "1245"}));
    EXPECT_EQ(result.records[1], (Record{"Peter", "3545"}));
    EXPECT_EQ(result.records[2], (Record{"Susan", "6784"}));
    EXPECT_EQ(result.records[3], (Record{"Sarah", "4321"}));
    EXPECT_EQ(reader.lines_read(), 7);
}

TEST(RecordReaderTest, ConsecutiveCommentLinesAreSkipped) {
    auto layout = LayoutBuilder().fields({4}).comment('#').line_ending(LineEnding::lf).build();
    auto reader = make_reader("#a\n#b\n#c\nabcd\n#d\n", layout);

    auto result = reader.read_all();

    ASSERT_TRUE(result.is_valid());
    ASSERT_EQ(result.records.size(), 1);
    EXPECT_EQ(result.records[0], (Record{"abcd"}));
    EXPECT_EQ(reader.lines_read(), 5);
}

TEST(RecordReaderTest, CommentOnlyInputYieldsNoRecords) {
    auto layout = LayoutBuilder().fields({4}).comment(';').line_ending(LineEnding::lf).build();
    auto reader = make_reader(";one\n;two\n", layout);

    auto result = reader.read_all();

    EXPECT_TRUE(result.is_valid());
    EXPECT_TRUE(result.records.empty());
}

TEST(RecordReaderTest, EmptyLineIsNotAComment) {
    auto layout = LayoutBuilder().fields({4}).comment('#').line_ending(LineEnding::lf).build();
    auto reader = make_reader("\nabcd\n", layout);

    auto result = reader.read();

    EXPECT_EQ(result.error.code, ErrorCode::incorrect_line_width);
    EXPECT_EQ(result.error.line, 1);
}

TEST(RecordReaderTest, TrimStripsSpacesAndTabs) {
    auto layout = LayoutBuilder().fields({6, 3}).line_ending(LineEnding::lf).trim().build();
    auto reader = make_reader("\t ab  x\t \n", layout);

    auto result = reader.read();

    ASSERT_TRUE(result.is_valid());
    EXPECT_EQ(result.fields, (Record{"ab", "x"}));
}

TEST(RecordReaderTest, WithoutTrimFieldsAreRaw) {
    auto layout = LayoutBuilder().fields({6, 3}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("\t ab  x\t \n", layout);

    auto result = reader.read();

    ASSERT_TRUE(result.is_valid());
    EXPECT_EQ(result.fields, (Record{"\t ab  ", "x\t "}));
}

TEST(RecordReaderTest, SkipRegionsAreDiscarded) {
    auto layout =
        LayoutBuilder().fields({3, 2}).skip_start(1).skip_end(2).line_ending(LineEnding::lf).build();
    auto reader = make_reader(">abcde<<\n", layout);

    auto result = reader.read();

    ASSERT_TRUE(result.is_valid());
    EXPECT_EQ(result.fields, (Record{"abc", "de"}));
}

TEST(RecordReaderTest, NegativeSkipsAreClampedToZero) {
    Layout layout;
    layout.field_lengths = {4};
    layout.skip_start = -3;
    layout.skip_end = -1;
    layout.skip_lines = -2;
    layout.line_ending = LineEnding::lf;
    auto reader = make_reader("abcd\n", layout);

    auto result = reader.read();

    ASSERT_TRUE(result.is_valid());
    EXPECT_EQ(result.fields, (Record{"abcd"}));
}

// =============================================================================
// Line endings
// =============================================================================

TEST(RecordReaderTest, DefaultLineEndingIsCrlf) {
    Layout layout;
    layout.field_lengths = {2, 2};
    auto reader = make_reader("abcd\r\nefgh\r\n", layout);

    auto result = reader.read_all();

    ASSERT_TRUE(result.is_valid());
    ASSERT_EQ(result.records.size(), 2);
    EXPECT_EQ(result.records[0], (Record{"ab", "cd"}));
    EXPECT_EQ(result.records[1], (Record{"ef", "gh"}));
}

TEST(RecordReaderTest, CrlfWithoutLineFeedIsMalformed) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::crlf).build();
    auto reader = make_reader("abcd\rxefgh\r\n", layout);

    auto first = reader.read();
    EXPECT_EQ(first.error.code, ErrorCode::malformed_line_ending);
    EXPECT_EQ(first.error.line, 1);
    EXPECT_EQ(first.error.column, 5);

    // The byte after the lone CR stays in the stream
    auto second = reader.read();
    EXPECT_EQ(second.error.code, ErrorCode::incorrect_line_width);
    EXPECT_EQ(second.error.line, 2);
}

TEST(RecordReaderTest, CrlfEndingAtLoneCrIsMalformed) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::crlf).build();
    auto reader = make_reader("abcd\r", layout);

    auto result = reader.read();

    EXPECT_EQ(result.error.code, ErrorCode::malformed_line_ending);
}

TEST(RecordReaderTest, CarriageReturnMode) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::cr).build();
    auto reader = make_reader("abcd\refgh\r", layout);

    auto result = reader.read_all();

    ASSERT_TRUE(result.is_valid());
    ASSERT_EQ(result.records.size(), 2);
    EXPECT_EQ(result.records[1], (Record{"efgh"}));
}

TEST(RecordReaderTest, NoLineEndingReadsFixedByteCount) {
    auto layout = LayoutBuilder().fields({2, 2}).line_ending(LineEnding::none).build();
    auto reader = make_reader("abcdefgh", layout);

    auto result = reader.read_all();

    ASSERT_TRUE(result.is_valid());
    ASSERT_EQ(result.records.size(), 2);
    EXPECT_EQ(result.records[0], (Record{"ab", "cd"}));
    EXPECT_EQ(result.records[1], (Record{"ef", "gh"}));
}

TEST(RecordReaderTest, NoLineEndingShortTailIsIncorrectWidth) {
    auto layout = LayoutBuilder().fields({2, 2}).line_ending(LineEnding::none).build();
    auto reader = make_reader("abcdefg", layout);

    EXPECT_TRUE(reader.read().is_valid());

    auto tail = reader.read();
    EXPECT_EQ(tail.error.code, ErrorCode::incorrect_line_width);
    EXPECT_EQ(tail.error.line, 2);
}

TEST(RecordReaderTest, NoLineEndingRejectsEmbeddedNewline) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::none).build();
    auto reader = make_reader("ab\ncd", layout);

    auto result = reader.read();

    EXPECT_EQ(result.error.code, ErrorCode::incorrect_line_width);
    EXPECT_EQ(result.error.column, 3);
}

TEST(RecordReaderTest, UnterminatedFinalLineIsRead) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("abcd\nefgh", layout);

    auto result = reader.read_all();

    ASSERT_TRUE(result.is_valid());
    ASSERT_EQ(result.records.size(), 2);
    EXPECT_EQ(result.records[1], (Record{"efgh"}));
}

TEST(RecordReaderTest, StrayCarriageReturnInLfLine) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("ab\rc\n", layout);

    auto result = reader.read();

    EXPECT_EQ(result.error.code, ErrorCode::incorrect_line_width);
    EXPECT_EQ(result.error.column, 3);
}

// =============================================================================
// Validation errors
// =============================================================================

TEST(RecordReaderTest, EmptyLayoutFailsBeforeTouchingStream) {
    auto reader = make_reader("abcd\r\n", Layout{});

    auto result = reader.read();

    EXPECT_EQ(result.error.code, ErrorCode::no_fields_configured);
    EXPECT_EQ(reader.source().tell(), 0);

    auto all = reader.read_all();
    EXPECT_EQ(all.error.code, ErrorCode::no_fields_configured);
    EXPECT_TRUE(all.records.empty());
    EXPECT_EQ(reader.source().tell(), 0);
}

TEST(RecordReaderTest, NonPositiveWidthIsRejected) {
    auto layout = LayoutBuilder().fields({3, 0, 2}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("abcde\n", layout);

    auto result = reader.read();

    EXPECT_EQ(result.error.code, ErrorCode::invalid_field_width);
    EXPECT_EQ(result.error.column, 2);
    EXPECT_EQ(reader.source().tell(), 0);
}

TEST(RecordReaderTest, ShortAndLongLinesAreIncorrectWidth) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::lf).build();

    for (const char* text : {"abc\n", "abcde\n", "\n"}) {
        auto reader = make_reader(text, layout);
        auto result = reader.read();
        EXPECT_EQ(result.error.code, ErrorCode::incorrect_line_width) << text;
        EXPECT_EQ(result.error.line, 1) << text;
    }
}

TEST(RecordReaderTest, ErrorLineCountsHeaderAndComments) {
    auto layout = LayoutBuilder()
                      .fields({4})
                      .skip_lines(1)
                      .comment('#')
                      .line_ending(LineEnding::lf)
                      .build();
    auto reader = make_reader("header\n#note\nbad\n", layout);

    auto result = reader.read();

    EXPECT_EQ(result.error.code, ErrorCode::incorrect_line_width);
    EXPECT_EQ(result.error.line, 3);
    EXPECT_EQ(result.error.message(), "line 3, column 0: Incorrect line width");
}

// =============================================================================
// End of stream and multi-record reads
// =============================================================================

TEST(RecordReaderTest, ReadReportsEndOfStream) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("abcd\n", layout);

    EXPECT_TRUE(reader.read().is_valid());

    auto result = reader.read();
    EXPECT_TRUE(result.is_eof());
    EXPECT_EQ(result.error.line, 2);
    EXPECT_TRUE(result.fields.empty());
}

TEST(RecordReaderTest, EndOfStreamDuringHeaderSkip) {
    auto layout = LayoutBuilder().fields({1}).skip_lines(3).line_ending(LineEnding::lf).build();

    auto reader = make_reader("a\nb\n", layout);
    auto single = reader.read();
    EXPECT_TRUE(single.is_eof());
    EXPECT_FALSE(reader.header_skipped());

    auto again = make_reader("a\nb\n", layout);
    auto all = again.read_all();
    EXPECT_TRUE(all.is_valid());
    EXPECT_TRUE(all.records.empty());
}

TEST(RecordReaderTest, BrokenCrlfInHeaderIsEndOfStream) {
    auto layout = LayoutBuilder().fields({2}).skip_lines(1).build();

    auto reader = make_reader("hdr\rX\r\nab\r\n", layout);
    auto single = reader.read();
    EXPECT_TRUE(single.is_eof());
    EXPECT_FALSE(single.error.is_parse_error());
    EXPECT_EQ(single.error.line, 2);
    EXPECT_EQ(single.error.column, 0);
    EXPECT_FALSE(reader.header_skipped());

    auto again = make_reader("hdr\rX\r\nab\r\n", layout);
    auto all = again.read_all();
    EXPECT_TRUE(all.is_valid());
    EXPECT_TRUE(all.records.empty());
}

TEST(RecordReaderTest, ShortNoneModeHeaderIsEndOfStream) {
    auto layout =
        LayoutBuilder().fields({4}).skip_lines(1).line_ending(LineEnding::none).build();
    auto reader = make_reader("ab", layout);

    auto result = reader.read();
    EXPECT_TRUE(result.is_eof());
    EXPECT_EQ(result.error.line, 2);
}

TEST(RecordReaderTest, ReadRowsStopsAtRequestedCount) {
    auto layout = LayoutBuilder().fields({2}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("aa\nbb\ncc\n", layout);

    auto first = reader.read_rows(2);
    ASSERT_TRUE(first.is_valid());
    ASSERT_EQ(first.records.size(), 2);
    EXPECT_EQ(first.records[1], (Record{"bb"}));

    auto rest = reader.read_rows(5);
    EXPECT_TRUE(rest.error.is_eof());
    ASSERT_EQ(rest.records.size(), 1);
    EXPECT_EQ(rest.records[0], (Record{"cc"}));
}

TEST(RecordReaderTest, ReadRowsReturnsPartialResultsOnError) {
    auto layout = LayoutBuilder().fields({2}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("aa\nbbb\ncc\n", layout);

    auto result = reader.read_rows(3);

    EXPECT_EQ(result.error.code, ErrorCode::incorrect_line_width);
    EXPECT_EQ(result.error.line, 2);
    ASSERT_EQ(result.records.size(), 1);
    EXPECT_EQ(result.records[0], (Record{"aa"}));
}

TEST(RecordReaderTest, ReadAllPropagatesParseErrorWithPartialRecords) {
    auto layout = LayoutBuilder().fields({2}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("aa\nbb\nc\ndd\n", layout);

    auto result = reader.read_all();

    EXPECT_EQ(result.error.code, ErrorCode::incorrect_line_width);
    EXPECT_EQ(result.error.line, 3);
    EXPECT_EQ(result.records.size(), 2);
}

TEST(RecordReaderTest, LayoutMayChangeBetweenRecords) {
    auto layout = LayoutBuilder().fields({4}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("abcd\nxy\n", layout);

    EXPECT_TRUE(reader.read().is_valid());

    reader.layout().field_lengths = {1, 1};
    auto second = reader.read();
    ASSERT_TRUE(second.is_valid());
    EXPECT_EQ(second.fields, (Record{"x", "y"}));
}

TEST(RecordReaderTest, CommentInsideHeaderCountsAsHeaderLine) {
    auto layout =
        LayoutBuilder().fields({2}).skip_lines(2).comment('#').line_ending(LineEnding::lf).build();
    auto reader = make_reader("#x\nhh\nab\n", layout);

    auto result = reader.read();
    ASSERT_TRUE(result.is_valid());
    EXPECT_EQ(result.fields, (Record{"ab"}));
    EXPECT_EQ(reader.lines_read(), 3);
}

TEST(RecordReaderTest, ResetSkipsHeaderAgainAfterRewind) {
    auto layout = LayoutBuilder().fields({2}).skip_lines(1).line_ending(LineEnding::lf).build();
    auto reader = make_reader("hh\nab\ncd\n", layout);

    auto first = reader.read_all();
    ASSERT_TRUE(first.is_valid());
    EXPECT_EQ(first.records.size(), 2);
    EXPECT_TRUE(reader.header_skipped());
    EXPECT_EQ(reader.records_read(), 2);

    reader.source().rewind();
    reader.reset();
    EXPECT_FALSE(reader.header_skipped());
    EXPECT_EQ(reader.lines_read(), 0);

    auto again = reader.read();
    ASSERT_TRUE(again.is_valid());
    EXPECT_EQ(again.fields, (Record{"ab"}));
    EXPECT_EQ(reader.lines_read(), 2);
}

// =============================================================================
// Iteration helpers
// =============================================================================

TEST(RecordReaderTest, ForEachRecordStopsWhenCallbackReturnsFalse) {
    auto layout = LayoutBuilder().fields({1}).line_ending(LineEnding::lf).build();
    auto reader = make_reader("a\nb\nc\nd\n", layout);

    std::vector<std::string> seen;
    auto result = fwio::for_each_record(reader, [&](const Record& rec) {
        seen.push_back(rec[0]);
        return seen.size() < 2;
    });

    EXPECT_EQ(result.count, 2);
    EXPECT_TRUE(result.error.ok());
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
}

TEST(RecordReaderTest, ForEachRecordWhereFiltersOnColumn) {
    auto layout = LayoutBuilder().fields({2, 3}).line_ending(LineEnding::lf).trim().build();
    auto reader = make_reader("usabc\nzadef\nus gh\n", layout);

    std::vector<std::string> seen;
    auto result = fwio::for_each_record_where(reader, 0, "us", [&](const Record& rec) {
        seen.push_back(rec[1]);
        return true;
    });

    EXPECT_EQ(result.count, 2);
    EXPECT_TRUE(result.error.is_eof());
    EXPECT_TRUE(result.is_valid());
    EXPECT_EQ(seen, (std::vector<std::string>{"abc", "gh"}));
}
