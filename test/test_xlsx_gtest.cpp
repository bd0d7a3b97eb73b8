#include <gtest/gtest.h>

#include "convert/Dispatcher.hpp"
#include "extract/Errors.hpp"
#include "extract/Extractors.hpp"
#include "extract/XlsxReader.hpp"
#include "test_fixtures.hpp"

using namespace extract;
using fixtures::TempDir;

static const char* kMainNs = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";

static std::string worksheet(const std::string& rows) {
    return std::string("<worksheet xmlns=\"") + kMainNs + "\"><sheetData>" + rows + "</sheetData></worksheet>";
}

TEST(XlsxReaderTest, ColumnIndex) {
    EXPECT_EQ(column_index("A1"), 0);
    EXPECT_EQ(column_index("Z9"), 25);
    EXPECT_EQ(column_index("AA10"), 26);
    EXPECT_EQ(column_index("xfd1"), 16383);
    EXPECT_EQ(column_index("12"), -1);
    EXPECT_EQ(column_index("XFE1"), -1);
}

TEST(XlsxReaderTest, ResolvePart) {
    EXPECT_EQ(resolve_part("xl/", "worksheets/sheet1.xml"), "xl/worksheets/sheet1.xml");
    EXPECT_EQ(resolve_part("xl/", "/xl/worksheets/sheet2.xml"), "xl/worksheets/sheet2.xml");
    EXPECT_EQ(resolve_part("xl/", "../custom/sheet.xml"), "custom/sheet.xml");
    EXPECT_EQ(resolve_part("xl/", "./sharedStrings.xml"), "xl/sharedStrings.xml");
}

TEST(XlsxReaderTest, SheetsInWorkbookOrder) {
    TempDir tmp;
    const auto p = tmp / "book.xlsx";
    fixtures::write_xlsx(p, {{"Zeta", {{"a"}}}, {"Alpha", {{"b"}}}, {"Mid", {{"c"}}}});

    Workbook wb(p);
    EXPECT_EQ(wb.sheet_names(), (std::vector<std::string>{"Zeta", "Alpha", "Mid"}));
    EXPECT_EQ(wb.read_sheet(1).columns, (std::vector<std::string>{"b"}));
    EXPECT_THROW(wb.read_sheet(3), ExtractionError);
}

TEST(XlsxReaderTest, SingleSheetRendersOneSection) {
    TempDir tmp;
    const auto p = tmp / "stock.xlsx";
    fixtures::write_xlsx(p, {{"Sheet1", {{"Name", "Qty"}, {"pen", "3"}, {"ink", "12"}}}});

    const ExtractedDocument doc = extract_spreadsheet(p);
    EXPECT_FALSE(doc.multi);
    ASSERT_EQ(doc.sections.size(), 1u);
    EXPECT_EQ(doc.sections[0].title, "stock.xlsx");
    EXPECT_EQ(doc.sections[0].body,
              "| Name | Qty |\n"
              "|:-----|----:|\n"
              "| pen  |   3 |\n"
              "| ink  |  12 |");
}

TEST(XlsxReaderTest, MultipleSheetsGoToSubdirectory) {
    TempDir tmp;
    const auto p = tmp / "Report 2024.xlsx";
    fixtures::write_xlsx(p, {{"Q1 Sales", {{"x"}, {"1"}}}, {"Notes", {}}});

    const ExtractedDocument doc = extract_spreadsheet(p);
    EXPECT_TRUE(doc.multi);
    ASSERT_EQ(doc.sections.size(), 2u);
    EXPECT_EQ(doc.sections[0].title, "Q1 Sales");
    EXPECT_EQ(doc.sections[1].title, "Notes");
    EXPECT_EQ(doc.sections[1].body, "_(Empty table)_\n");

    const auto out = tmp / "out";
    const auto paths = convert::output_paths_for(p, doc, out);
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], out / "Report_2024" / "Q1_Sales.md");
    EXPECT_EQ(paths[1], out / "Report_2024" / "Notes.md");
}

TEST(XlsxReaderTest, SharedStringsSparseCellsAndTypes) {
    TempDir tmp;
    const auto p = tmp / "raw.xlsx";

    const std::string rows =
        "<row r=\"2\"><c r=\"B2\" t=\"s\"><v>0</v></c><c r=\"C2\" t=\"s\"><v>1</v></c></row>"
        "<row r=\"4\"><c r=\"A4\" t=\"b\"><v>1</v></c><c r=\"C4\"><v>3.5</v></c></row>"
        "<row r=\"5\"><c r=\"B5\" t=\"s\"><v>2</v></c></row>";

    fixtures::write_zip(p, {
        {"xl/workbook.xml",
         std::string("<workbook xmlns=\"") + kMainNs +
             "\" xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
             "<sheets><sheet name=\"Data\" sheetId=\"1\" r:id=\"rId7\"/></sheets></workbook>"},
        {"xl/_rels/workbook.xml.rels",
         "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
         "<Relationship Id=\"rId7\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" "
         "Target=\"/xl/worksheets/data.xml\"/>"
         "<Relationship Id=\"rId8\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings\" "
         "Target=\"strings.xml\"/>"
         "</Relationships>"},
        {"xl/strings.xml",
         std::string("<sst xmlns=\"") + kMainNs + "\">"
             "<si><t>h1</t></si>"
             "<si><r><t>h</t></r><r><t>2</t></r></si>"
             "<si><t>last</t></si></sst>"},
        {"xl/worksheets/data.xml", worksheet(rows)},
    });

    Workbook wb(p);
    ASSERT_EQ(wb.sheets().size(), 1u);
    EXPECT_EQ(wb.sheets()[0].name, "Data");
    EXPECT_EQ(wb.sheets()[0].part, "xl/worksheets/data.xml");

    const table::Table t = wb.read_sheet(0);
    EXPECT_EQ(t.columns, (std::vector<std::string>{"", "h1", "h2"}));
    ASSERT_EQ(t.rows.size(), 3u);
    EXPECT_EQ(t.rows[0], (std::vector<std::string>{"", "", ""}));
    EXPECT_EQ(t.rows[1], (std::vector<std::string>{"True", "", "3.5"}));
    EXPECT_EQ(t.rows[2], (std::vector<std::string>{"", "last", ""}));
}

TEST(XlsxReaderTest, MissingRelationshipsFallsBackToSheetParts) {
    TempDir tmp;
    const auto p = tmp / "norels.xlsx";
    fixtures::write_zip(p, {
        {"xl/workbook.xml", std::string("<workbook xmlns=\"") + kMainNs + "\"><sheets/></workbook>"},
        {"xl/worksheets/sheet1.xml",
         worksheet("<row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>k</t></is></c></row>")},
        {"xl/worksheets/sheet2.xml", worksheet("")},
    });

    Workbook wb(p);
    EXPECT_EQ(wb.sheet_names(), (std::vector<std::string>{"Sheet1", "Sheet2"}));
    EXPECT_EQ(wb.read_sheet(0).columns, (std::vector<std::string>{"k"}));
    EXPECT_TRUE(wb.read_sheet(1).empty());
}

TEST(XlsxReaderTest, MissingRelationshipsKeepsListedSheetNames) {
    TempDir tmp;
    const auto p = tmp / "Quarterly.xlsx";
    fixtures::write_zip(p, {
        {"xl/workbook.xml",
         std::string("<workbook xmlns=\"") + kMainNs + "\"><sheets>"
             "<sheet name=\"Summary\" sheetId=\"1\"/><sheet name=\"Q1 Detail\" sheetId=\"2\"/>"
             "</sheets></workbook>"},
        {"xl/worksheets/sheet1.xml", worksheet("")},
        {"xl/worksheets/sheet2.xml", worksheet("")},
        {"xl/worksheets/sheet3.xml", worksheet("")},
    });

    Workbook wb(p);
    EXPECT_EQ(wb.sheet_names(), (std::vector<std::string>{"Summary", "Q1 Detail", "Sheet3"}));

    const ExtractedDocument doc = extract_spreadsheet(p);
    ASSERT_EQ(doc.sections.size(), 3u);
    EXPECT_EQ(doc.sections[1].title, "Q1 Detail");
    const auto paths = convert::output_paths_for(p, doc, tmp / "out");
    EXPECT_EQ(paths[1], tmp / "out" / "Quarterly" / "Q1_Detail.md");
}

TEST(XlsxReaderTest, NumericAndDateCellsFormattedByType) {
    TempDir tmp;
    const auto p = tmp / "typed.xlsx";

    const std::string rows =
        "<row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>when</t></is></c>"
        "<c r=\"B1\" t=\"inlineStr\"><is><t>amount</t></is></c></row>"
        "<row r=\"2\"><c r=\"A2\" s=\"1\"><v>45292</v></c><c r=\"B2\"><v>4.5999999999999996</v></c></row>"
        "<row r=\"3\"><c r=\"A3\" s=\"2\"><v>45292.5</v></c><c r=\"B3\" s=\"3\" t=\"n\"><v>3.0</v></c></row>"
        "<row r=\"4\"><c r=\"A4\" s=\"1\"><v>0.75</v></c><c r=\"B4\" s=\"0\"><v>1E-05</v></c></row>"
        "<row r=\"5\"><c r=\"A5\" t=\"d\"><v>2023-07-14T08:30:00Z</v></c>"
        "<c r=\"B5\" t=\"e\"><v>#DIV/0!</v></c></row>";

    fixtures::write_zip(p, {
        {"xl/workbook.xml", std::string("<workbook xmlns=\"") + kMainNs + "\"/>"},
        {"xl/styles.xml",
         std::string("<styleSheet xmlns=\"") + kMainNs + "\">"
             "<numFmts count=\"2\">"
             "<numFmt numFmtId=\"164\" formatCode=\"yyyy\\-mm\\-dd hh:mm\"/>"
             "<numFmt numFmtId=\"165\" formatCode=\"0.00&quot; days&quot;\"/>"
             "</numFmts>"
             "<cellXfs count=\"4\">"
             "<xf numFmtId=\"0\"/><xf numFmtId=\"14\"/><xf numFmtId=\"164\"/><xf numFmtId=\"165\"/>"
             "</cellXfs></styleSheet>"},
        {"xl/worksheets/sheet1.xml", worksheet(rows)},
    });

    const table::Table t = Workbook(p).read_sheet(0);
    ASSERT_EQ(t.rows.size(), 4u);
    EXPECT_EQ(t.rows[0], (std::vector<std::string>{"2024-01-01 00:00:00", "4.6"}));
    EXPECT_EQ(t.rows[1], (std::vector<std::string>{"2024-01-01 12:00:00", "3"}));
    EXPECT_EQ(t.rows[2], (std::vector<std::string>{"18:00:00", "1e-05"}));
    EXPECT_EQ(t.rows[3], (std::vector<std::string>{"2023-07-14 08:30:00", "#DIV/0!"}));
}

TEST(XlsxReaderTest, Date1904System) {
    TempDir tmp;
    const auto p = tmp / "mac.xlsx";
    fixtures::write_zip(p, {
        {"xl/workbook.xml", std::string("<workbook xmlns=\"") + kMainNs + "\"><workbookPr date1904=\"1\"/></workbook>"},
        {"xl/styles.xml",
         std::string("<styleSheet xmlns=\"") + kMainNs + "\"><cellXfs><xf numFmtId=\"0\"/><xf numFmtId=\"22\"/>"
             "</cellXfs></styleSheet>"},
        {"xl/worksheets/sheet1.xml",
         worksheet("<row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>d</t></is></c></row>"
                   "<row r=\"2\"><c r=\"A2\" s=\"1\"><v>1</v></c></row>")},
    });

    const table::Table t = Workbook(p).read_sheet(0);
    ASSERT_EQ(t.rows.size(), 1u);
    EXPECT_EQ(t.rows[0][0], "1904-01-02 00:00:00");
}

TEST(CellFormatTest, ExcelSerialDates) {
    EXPECT_EQ(format_excel_serial(45292), "2024-01-01 00:00:00");
    EXPECT_EQ(format_excel_serial(45292.25), "2024-01-01 06:00:00");
    EXPECT_EQ(format_excel_serial(45292 + 1.5 / 86400), "2024-01-01 00:00:01.500000");
    EXPECT_EQ(format_excel_serial(1), "1900-01-01 00:00:00");
    EXPECT_EQ(format_excel_serial(59), "1900-02-28 00:00:00");
    EXPECT_EQ(format_excel_serial(61), "1900-03-01 00:00:00");
    EXPECT_EQ(format_excel_serial(0.5), "12:00:00");
    EXPECT_EQ(format_excel_serial(0), "00:00:00");
    EXPECT_EQ(format_excel_serial(0, true), "00:00:00");
    EXPECT_EQ(format_excel_serial(366, true), "1905-01-01 00:00:00");
}

TEST(CellFormatTest, NumbersUseShortestRoundTrip) {
    EXPECT_EQ(format_number("4.5999999999999996"), "4.6");
    EXPECT_EQ(format_number("0.1"), "0.1");
    EXPECT_EQ(format_number("123.456"), "123.456");
    EXPECT_EQ(format_number("3.0"), "3");
    EXPECT_EQ(format_number("-2"), "-2");
    EXPECT_EQ(format_number("-0"), "0");
    EXPECT_EQ(format_number("1E+20"), "100000000000000000000");
    EXPECT_EQ(format_number("1.5E-7"), "1.5e-07");
    EXPECT_EQ(format_number("abc"), "abc");
    EXPECT_EQ(format_number(""), "");
}

TEST(CellFormatTest, DateFormatCodes) {
    EXPECT_TRUE(is_date_format_code("yyyy-mm-dd"));
    EXPECT_TRUE(is_date_format_code("h:mm AM/PM"));
    EXPECT_TRUE(is_date_format_code("[$-409]d-mmm-yy"));
    EXPECT_FALSE(is_date_format_code("General"));
    EXPECT_FALSE(is_date_format_code("0.00"));
    EXPECT_FALSE(is_date_format_code("0.00\" days\""));
    EXPECT_FALSE(is_date_format_code("[Red]#,##0"));
    EXPECT_FALSE(is_date_format_code("\\d0"));
    EXPECT_FALSE(is_date_format_code("0;yyyy"));

    EXPECT_TRUE(is_builtin_date_format(14));
    EXPECT_TRUE(is_builtin_date_format(22));
    EXPECT_TRUE(is_builtin_date_format(47));
    EXPECT_FALSE(is_builtin_date_format(0));
    EXPECT_FALSE(is_builtin_date_format(44));
}

TEST(XlsxReaderTest, SharedStringIndexOutOfRange) {
    TempDir tmp;
    const auto p = tmp / "bad.xlsx";
    fixtures::write_zip(p, {
        {"xl/workbook.xml", std::string("<workbook xmlns=\"") + kMainNs + "\"/>"},
        {"xl/worksheets/sheet1.xml", worksheet("<row r=\"1\"><c r=\"A1\" t=\"s\"><v>4</v></c></row>")},
    });

    Workbook wb(p);
    EXPECT_THROW(wb.read_sheet(0), ExtractionError);
}

TEST(XlsxReaderTest, NotAWorkbook) {
    TempDir tmp;
    const auto junk = tmp / "junk.xlsx";
    fixtures::write_file(junk, "this is not a zip file");
    EXPECT_THROW(extract_spreadsheet(junk), std::runtime_error);

    const auto docx = tmp / "wrong.xlsx";
    fixtures::write_docx(docx, {"hello"});
    EXPECT_THROW(extract_spreadsheet(docx), ExtractionError);
}

TEST(XlsxReaderTest, MalformedSheetXml) {
    TempDir tmp;
    const auto p = tmp / "broken.xlsx";
    fixtures::write_zip(p, {
        {"xl/workbook.xml", std::string("<workbook xmlns=\"") + kMainNs + "\"/>"},
        {"xl/worksheets/sheet1.xml", "<worksheet><sheetData><row>"},
    });

    Workbook wb(p);
    EXPECT_THROW(wb.read_sheet(0), ExtractionError);
}
