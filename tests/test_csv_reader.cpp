#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "io/csv_reader.hpp"

using namespace payline;

TEST_CASE("CsvReader splits plain rows", "[csv]") {
    std::istringstream is("a,b,c\n1,2,3\n");
    CsvReader reader(is);

    auto header = reader.read_row();
    REQUIRE(header == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(reader.has_more());

    auto row = reader.read_row();
    REQUIRE(row == std::vector<std::string>{"1", "2", "3"});
    REQUIRE_FALSE(reader.has_more());
}

TEST_CASE("CsvReader handles quoted fields", "[csv]") {
    std::istringstream is("\"1,040\",\"say \"\"hi\"\"\",\"two\nlines\"\n");
    CsvReader reader(is);

    auto row = reader.read_row();
    REQUIRE(row.size() == 3);
    REQUIRE(row[0] == "1,040");
    REQUIRE(row[1] == "say \"hi\"");
    REQUIRE(row[2] == "two\nlines");
}

TEST_CASE("CsvReader handles CRLF and missing final newline", "[csv]") {
    std::istringstream is("a,b\r\n1,2");
    CsvReader reader(is);

    REQUIRE(reader.read_row() == std::vector<std::string>{"a", "b"});
    REQUIRE(reader.read_row() == std::vector<std::string>{"1", "2"});
    REQUIRE_FALSE(reader.has_more());
}

TEST_CASE("CsvReader skips a byte-order mark", "[csv]") {
    std::istringstream is("\xEF\xBB\xBF" "Candidate RefNo,Weekending\nC1,05/03/25\n");
    CsvReader reader(is);

    auto header = reader.read_row();
    REQUIRE(header[0] == "Candidate RefNo");
}

TEST_CASE("CsvReader trims cells and keeps empty ones", "[csv]") {
    std::istringstream is(" a , ,c,\n");
    CsvReader reader(is);

    auto row = reader.read_row();
    REQUIRE(row == std::vector<std::string>{"a", "", "c", ""});
}

TEST_CASE("CsvReader::is_blank", "[csv]") {
    REQUIRE(CsvReader::is_blank({}));
    REQUIRE(CsvReader::is_blank({""}));
    REQUIRE(CsvReader::is_blank({"", "", ""}));
    REQUIRE_FALSE(CsvReader::is_blank({"", "x"}));
}

TEST_CASE("HeaderIndex looks up cells by column name", "[csv]") {
    HeaderIndex header({"Std1 Hrs", "Std Hrs", "Rate", "Rate"});
    std::vector<std::string> row = {"", "37.5", "12", "99"};

    REQUIRE(header.has("Std Hrs"));
    REQUIRE_FALSE(header.has("OT1 Hrs"));
    REQUIRE(header.get(row, "Std Hrs") == "37.5");
    REQUIRE(header.get(row, "OT1 Hrs") == "");

    SECTION("Duplicate header: first occurrence wins") {
        REQUIRE(header.get(row, "Rate") == "12");
    }

    SECTION("first_of skips absent and empty columns") {
        REQUIRE(header.first_of(row, {"Std1 Hrs", "Std Hrs"}) == "37.5");
        REQUIRE(header.first_of(row, {"Missing", "Rate"}) == "12");
        REQUIRE(header.first_of(row, {"Missing"}) == "");
    }

    SECTION("Short rows read as empty") {
        std::vector<std::string> short_row = {"8"};
        REQUIRE(header.get(short_row, "Rate") == "");
    }
}

TEST_CASE("CsvWriter quotes only when needed", "[csv]") {
    REQUIRE(CsvWriter::quote("plain") == "plain");
    REQUIRE(CsvWriter::quote("a,b") == "\"a,b\"");
    REQUIRE(CsvWriter::quote("say \"hi\"") == "\"say \"\"hi\"\"\"");
    REQUIRE(CsvWriter::quote("line\nbreak") == "\"line\nbreak\"");

    std::ostringstream os;
    CsvWriter writer(os);
    writer.write_row({"C001", "Std Hrs - Acme, Ltd - Driver", "37.5"});
    REQUIRE(os.str() == "C001,\"Std Hrs - Acme, Ltd - Driver\",37.5\n");
}
