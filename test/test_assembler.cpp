#include <catch2/catch.hpp>
#include <vcsv/assembler.h>
#include <vcsv/source.h>

using vcsv::ColumnAssembler;
using vcsv::RawRecord;
using vcsv::RowAssembler;

namespace {
    template <typename Assembler>
    std::vector<RawRecord> assemble(const std::string& text) {
        vcsv::StringSource source(text);
        vcsv::Tokenizer tokenizer(source);
        Assembler assembler(tokenizer);
        std::vector<RawRecord> out;
        RawRecord raw;
        while (assembler.next(raw)) out.push_back(raw);
        return out;
    }
}  // anonymous namespace

TEST_CASE("Rows pair with the header by position", "[assembler][unit]") {
    auto records = assemble<RowAssembler>("Name,Age\nAlice,30\nBob,25\n");
    REQUIRE(records.size() == 2);
    REQUIRE(records[0] == RawRecord{{"Name", "Alice"}, {"Age", "30"}});
    REQUIRE(records[1] == RawRecord{{"Name", "Bob"}, {"Age", "25"}});
}

TEST_CASE("Rows pair up to the shorter side", "[assembler][unit]") {
    auto records = assemble<RowAssembler>("Name,Age,Email\nAlice\nBob,25,b@x,extra\n");
    REQUIRE(records.size() == 2);
    REQUIRE(records[0] == RawRecord{{"Name", "Alice"}});
    REQUIRE(records[1] == RawRecord{{"Name", "Bob"}, {"Age", "25"}, {"Email", "b@x"}});
}

TEST_CASE("Blank lines before and between rows are skipped", "[assembler][unit]") {
    auto records = assemble<RowAssembler>("\n , \nName,Age\n\nAlice,30\n\n");
    REQUIRE(records.size() == 1);
    REQUIRE(records[0] == RawRecord{{"Name", "Alice"}, {"Age", "30"}});
}

TEST_CASE("Header only or empty input gives no rows", "[assembler][unit]") {
    REQUIRE(assemble<RowAssembler>("Name,Age\n").empty());
    REQUIRE(assemble<RowAssembler>("").empty());
    REQUIRE(assemble<RowAssembler>("\n\n").empty());
}

TEST_CASE("Row assembler exposes the header", "[assembler][unit]") {
    vcsv::StringSource source("Name,Salary\nAlice,1\n");
    vcsv::Tokenizer tokenizer(source);
    RowAssembler assembler(tokenizer);
    REQUIRE(assembler.fieldNames().empty());
    RawRecord raw;
    REQUIRE(assembler.next(raw));
    REQUIRE(assembler.fieldNames() == std::vector<std::string>{"Name", "Salary"});
}

TEST_CASE("Columns become records", "[assembler][unit]") {
    auto records = assemble<ColumnAssembler>("Name,Alice,Bob\nAge,30,25\n");
    REQUIRE(records.size() == 2);
    REQUIRE(records[0] == RawRecord{{"Name", "Alice"}, {"Age", "30"}});
    REQUIRE(records[1] == RawRecord{{"Name", "Bob"}, {"Age", "25"}});
}

TEST_CASE("Short field line leaves the value out of later records", "[assembler][unit]") {
    auto records = assemble<ColumnAssembler>("Name,Alice,Bob,Carol\nPhone,555\nAge,30,25,41\n");
    REQUIRE(records.size() == 3);
    REQUIRE(records[0] == RawRecord{{"Name", "Alice"}, {"Phone", "555"}, {"Age", "30"}});
    REQUIRE(records[1] == RawRecord{{"Name", "Bob"}, {"Age", "25"}});
    REQUIRE(records[2] == RawRecord{{"Name", "Carol"}, {"Age", "41"}});
}

TEST_CASE("Record count is the longest field line", "[assembler][unit]") {
    vcsv::StringSource source("Name,A\n\nAge,1,2,3\nEmail\n");
    vcsv::Tokenizer tokenizer(source);
    ColumnAssembler assembler(tokenizer);
    REQUIRE(assembler.recordCount() == 3);
    REQUIRE(assembler.fieldNames() == std::vector<std::string>{"Name", "Age", "Email"});
}

TEST_CASE("Label-only lines give no records", "[assembler][unit]") {
    REQUIRE(assemble<ColumnAssembler>("Name\nAge\n").empty());
    REQUIRE(assemble<ColumnAssembler>("").empty());
}

TEST_CASE("Cancelled token stops both assemblers", "[assembler][unit][exception]") {
    vcsv::CancellationSource cancel;
    cancel.cancel();

    vcsv::StringSource rows("Name\nAlice\n");
    vcsv::Tokenizer row_tokenizer(rows);
    RowAssembler row_assembler(row_tokenizer, cancel.token());
    RawRecord raw;
    REQUIRE_THROWS_AS(row_assembler.next(raw), vcsv::OperationCancelled);

    vcsv::StringSource columns("Name,Alice\n");
    vcsv::Tokenizer column_tokenizer(columns);
    ColumnAssembler column_assembler(column_tokenizer, cancel.token());
    REQUIRE_THROWS_AS(column_assembler.next(raw), vcsv::OperationCancelled);
}
