#include <catch2/catch.hpp>
#include <vcsv/reader.h>
#include "test_helpers.h"

#include <algorithm>
#include <cstring>
#include <future>
#include <sstream>

using vcsv::Record;
using vcsv::Schema;
using vcsv_test::Table;

namespace {
    const char* kVerticalScenario =
        "Name,Alice,Bob\n"
        "Age,30,41\n"
        "Email,a@x.com,b@x.com\n"
        "Skills[0],Go,Rust\n"
        "Skills[2],,SQL\n";

    const char* kHorizontalScenario =
        "Name,Age,Email,Skills[0],Skills[2]\n"
        "Alice,30,a@x.com,Go,\n"
        "Bob,41,b@x.com,Rust,SQL\n";

    std::string people(int n) {
        std::string text = "Name,Age,Email\n";
        for (int i = 1; i <= n; ++i) {
            text += "P" + std::to_string(i) + "," + std::to_string(20 + i) + ",p" + std::to_string(i) + "@x\n";
        }
        return text;
    }

    // Hands out a few bytes per call and fires the cancellation source once
    // `cancel_after` reads have been served.
    class CancellingSource : public vcsv::Source {
    public:
        CancellingSource(std::string text, vcsv::CancellationSource& cancel, int cancel_after)
            : text_(std::move(text)), cancel_(cancel), cancel_after_(cancel_after) {}

        std::size_t read(char* dst, std::size_t n) override {
            if (++reads_ > cancel_after_) cancel_.cancel();
            std::size_t count = std::min<std::size_t>({n, 8, text_.size() - pos_});
            std::memcpy(dst, text_.data() + pos_, count);
            pos_ += count;
            return count;
        }
        const char* kind() const override { return "test"; }

    private:
        std::string text_;
        std::size_t pos_ = 0;
        vcsv::CancellationSource& cancel_;
        int cancel_after_;
        int reads_ = 0;
    };
}  // anonymous namespace

TEST_CASE("Vertical scenario yields both records", "[reader][unit]") {
    auto records = vcsv::parse_vertical_string(kVerticalScenario, Schema::v1()).readAll();
    REQUIRE(records.size() == 2);

    REQUIRE(records[0].name == "Alice");
    REQUIRE(records[0].age == 30);
    REQUIRE(records[0].email == "a@x.com");
    REQUIRE(records[0].skills == std::vector<std::string>{"Go", "", ""});

    REQUIRE(records[1].name == "Bob");
    REQUIRE(records[1].age == 41);
    REQUIRE(records[1].skills == std::vector<std::string>{"Rust", "", "SQL"});
}

TEST_CASE("Horizontal and vertical forms of the same table agree", "[reader][unit]") {
    auto horizontal = vcsv::parse_horizontal_string(kHorizontalScenario, Schema::v1()).readAll();
    auto vertical = vcsv::parse_vertical_string(kVerticalScenario, Schema::v1()).readAll();
    REQUIRE(horizontal == vertical);
}

TEST_CASE("Quoted values keep commas, quotes and newlines", "[reader][unit]") {
    std::string text =
        "Name,Age,Email,Notes\n"
        "\"Smith, John\",30,js@x,\"He said \"\"hi\"\"\nand left\"\n";
    auto records = vcsv::parse_horizontal_string(text, Schema::v4()).readAll();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].name == "Smith, John");
    REQUIRE(records[0].notes == std::string("He said \"hi\"\nand left"));
}

TEST_CASE("Records failing the schema are dropped", "[reader][unit]") {
    std::string text =
        "Name,Age,Email\n"
        "Alice,30,a@x\n"
        ",25,anon@x\n"
        "Carl,abc,c@x\n"
        "Dana,40,\n"
        "Eve,22,e@x\n";
    auto reader = vcsv::parse_horizontal_string(text, Schema::v1());
    auto records = reader.readAll();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].name == "Alice");
    REQUIRE(records[1].name == "Eve");
    REQUIRE(reader.recordsDecoded() == 5);
    REQUIRE(reader.recordsAccepted() == 2);
}

TEST_CASE("Unknown columns do not change the result", "[reader][unit]") {
    std::string plain = "Name,Age,Email\nAlice,30,a@x\n";
    std::string noisy = "Salary,Name,Hobbies[0],Age,Email,Manager.Name\n100,Alice,chess,30,a@x,Eve\n";
    REQUIRE(vcsv::parse_horizontal_string(noisy, Schema::v4()).readAll() ==
            vcsv::parse_horizontal_string(plain, Schema::v4()).readAll());
}

TEST_CASE("Transposing the input gives the same records", "[reader][unit]") {
    Table rows = {
        {"Name", "Age", "Email", "Phone", "Skills[1]", "Address.City", "Projects[0].Name", "Notes"},
        {"Smith, John", "30", "js@x", "555-0100", "C++", "Paris", "Apollo", "multi\nline \"quoted\""},
        {"Jane", "28", "jane@x", "", "", "", "", "C:\\temp"},
        {"No Age", "", "x@x", "1", "2", "3", "4", "5"},
    };
    auto horizontal = vcsv::parse_horizontal_string(vcsv_test::to_csv(rows), Schema::v4()).readAll();
    auto vertical =
        vcsv::parse_vertical_string(vcsv_test::to_csv(vcsv_test::transpose(rows)), Schema::v4()).readAll();

    REQUIRE(horizontal.size() == 2);
    REQUIRE(horizontal == vertical);
    REQUIRE(horizontal[0].skills == std::vector<std::string>{"", "C++"});
    REQUIRE(horizontal[1].skills == std::vector<std::string>{"", ""});
    REQUIRE(horizontal[1].notes == std::string("C:\\temp"));
    REQUIRE_FALSE(horizontal[1].address.has_value());
    REQUIRE(horizontal[1].projects.size() == 1);
}

TEST_CASE("Row-major cancellation keeps the records already produced", "[reader][unit][exception]") {
    vcsv::CancellationSource cancel;
    auto reader = vcsv::parse_horizontal_string(people(5), Schema::v1(), cancel.token());

    std::vector<Record> seen;
    for (int k = 0; k < 2; ++k) {
        auto r = reader.next();
        REQUIRE(r.has_value());
        seen.push_back(*r);
    }
    cancel.cancel();
    REQUIRE_THROWS_AS(reader.next(), vcsv::OperationCancelled);

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].name == "P1");
    REQUIRE(seen[1].name == "P2");
}

TEST_CASE("Cancellation during a read stops row-major input mid-way", "[reader][unit][exception]") {
    vcsv::CancellationSource cancel;
    std::string text = people(50);
    vcsv::RecordReader reader(std::make_unique<CancellingSource>(text, cancel, 3), vcsv::Layout::Horizontal,
                              Schema::v1(), cancel.token());

    std::vector<Record> seen;
    REQUIRE_THROWS_AS(
        [&] {
            while (auto r = reader.next()) seen.push_back(*r);
        }(),
        vcsv::OperationCancelled);
    REQUIRE(seen.size() < 50);
    for (size_t i = 0; i < seen.size(); ++i) {
        REQUIRE(seen[i].name == "P" + std::to_string(i + 1));
    }
}

TEST_CASE("Vertical cancellation before end of input yields nothing", "[reader][unit][exception]") {
    vcsv::CancellationSource cancel;
    std::string text = kVerticalScenario;
    vcsv::RecordReader reader(std::make_unique<CancellingSource>(text, cancel, 2), vcsv::Layout::Vertical,
                              Schema::v1(), cancel.token());

    std::vector<Record> seen;
    REQUIRE_THROWS_AS(
        [&] {
            while (auto r = reader.next()) seen.push_back(*r);
        }(),
        vcsv::OperationCancelled);
    REQUIRE(seen.empty());
}

TEST_CASE("Token that is never cancelled has no effect", "[reader][unit]") {
    vcsv::CancellationSource cancel;
    auto records = vcsv::parse_horizontal_string(people(3), Schema::v1(), cancel.token()).readAll();
    REQUIRE(records.size() == 3);
}

TEST_CASE("Iterating matches readAll", "[reader][unit]") {
    auto expected = vcsv::parse_horizontal_string(people(4), Schema::v1()).readAll();

    auto reader = vcsv::parse_horizontal_string(people(4), Schema::v1());
    std::vector<Record> iterated;
    for (auto const& r : reader) iterated.push_back(r);
    REQUIRE(iterated == expected);
}

TEST_CASE("Stream input", "[reader][unit]") {
    std::istringstream in(kVerticalScenario);
    auto reader = vcsv::parse_vertical(in, Schema::v1());
    REQUIRE(std::string(reader.sourceKind()) == "stream");
    REQUIRE(reader.readAll().size() == 2);
}

TEST_CASE("Mapped and buffered file reads agree", "[reader][unit]") {
    std::string path = vcsv_test::write_temp_file("reader_people.csv", people(20));

    auto buffered = vcsv::parse_horizontal_file(path, Schema::v1());
    auto mapped = vcsv::parse_horizontal_file(path, Schema::v1(), {}, 0);
    REQUIRE(std::string(buffered.sourceKind()) == "buffered file");
    REQUIRE(std::string(mapped.sourceKind()) == "memory-mapped");

    auto a = buffered.readAll();
    REQUIRE(a.size() == 20);
    REQUIRE(a == mapped.readAll());
}

TEST_CASE("Vertical file input", "[reader][unit]") {
    std::string path = vcsv_test::write_temp_file("reader_vertical.csv", kVerticalScenario);
    auto records = vcsv::parse_vertical_file(path, Schema::v1(), {}, 0).readAll();
    REQUIRE(records == vcsv::parse_vertical_string(kVerticalScenario, Schema::v1()).readAll());
}

TEST_CASE("Missing file throws IoError", "[reader][unit][exception]") {
    REQUIRE_THROWS_AS(vcsv::parse_horizontal_file("/nonexistent/vcsv/people.csv", Schema::v1()), vcsv::IoError);
}

TEST_CASE("Independent readers run concurrently", "[reader][unit]") {
    std::string path = vcsv_test::write_temp_file("reader_concurrent.csv", people(200));
    auto expected = vcsv::parse_horizontal_string(people(200), Schema::v1()).readAll();

    std::vector<std::future<std::vector<Record>>> jobs;
    for (int i = 0; i < 4; ++i) {
        jobs.push_back(std::async(std::launch::async, [&path, i] {
            std::uint64_t threshold = (i % 2) ? 0 : vcsv::kMappedFileThreshold;
            return vcsv::parse_horizontal_file(path, Schema::v1(), {}, threshold).readAll();
        }));
    }
    for (auto& job : jobs) {
        REQUIRE(job.get() == expected);
    }
}

TEST_CASE("Byte-order mark and CRLF", "[reader][unit]") {
    std::string text = "\xEF\xBB\xBFName,Age,Email\r\nAlice,30,a@x\r\n";
    auto records = vcsv::parse_horizontal_string(text, Schema::v1()).readAll();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].name == "Alice");
    REQUIRE(records[0].email == "a@x");
}

TEST_CASE("Full record under the richest schema", "[reader][unit]") {
    std::string text =
        "Name,Jane Doe\n"
        "Age,35\n"
        "Email,jane@x.com\n"
        "Phone,555-0199\n"
        "Department,Engineering\n"
        "StartDate,2018-04-01\n"
        "Skills[0],C++\n"
        "Skills[1],Python\n"
        "Languages[0],English\n"
        "Address.Street,\"1 Main St, Apt 2\"\n"
        "Address.City,Springfield\n"
        "Address.State,IL\n"
        "Address.ZipCode,62701\n"
        "Projects[0].Name,Apollo\n"
        "Projects[0].Role,Lead\n"
        "Projects[0].StartDate,2019-01-15\n"
        "Projects[0].EndDate,2020-06-30\n"
        "Projects[1].Name,Gemini\n"
        "Projects[1].Role,Dev\n"
        "Projects[1].StartDate,2021-02-01\n"
        "Notes,\"Line one\nLine two\"\n";
    auto reader = vcsv::parse_vertical_string(text, Schema::v4());
    auto records = reader.readAll();
    REQUIRE(records.size() == 1);

    Record const& r = records[0];
    REQUIRE(r.phone == std::string("555-0199"));
    REQUIRE(r.department == std::string("Engineering"));
    REQUIRE(r.startDate == vcsv::Date{2018, 4, 1});
    REQUIRE(r.skills == std::vector<std::string>{"C++", "Python"});
    REQUIRE(r.languages == std::vector<std::string>{"English"});
    REQUIRE(r.address == vcsv::Address{"1 Main St, Apt 2", "Springfield", "IL", "62701"});
    REQUIRE(r.projects.size() == 2);
    REQUIRE(r.projects[0].endDate == vcsv::Date{2020, 6, 30});
    REQUIRE_FALSE(r.projects[1].endDate.has_value());
    REQUIRE(r.notes == std::string("Line one\nLine two"));
    REQUIRE(reader.fieldNames().size() == 21);
}
