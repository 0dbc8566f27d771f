// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for RequestStats and RequestsTable

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "scenario/request_stats.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using namespace synthnet;
using namespace synthnet::scenario;
using Catch::Approx;
using json = nlohmann::json;

namespace {

metrics::Histogram OneToHundred() {
    metrics::Histogram h;
    for (uint64_t v = 1; v <= 100; ++v) {
        h.increment(v);
    }
    return h;
}

std::vector<std::string> Lines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST_CASE("DurationAsMs", "[scenario][stats]") {
    CHECK(DurationAsMs(std::chrono::milliseconds(250)) == Approx(250.0));
    CHECK(DurationAsMs(std::chrono::microseconds(1500)) == Approx(1.5));
    CHECK(DurationAsMs(std::chrono::seconds(0)) == Approx(0.0));
}

TEST_CASE("RequestStats columns", "[scenario][stats]") {
    RequestStats row(10, 20, OneToHundred(), 2.0);

    CHECK(row.samples() == 100);
    CHECK(row.attempted() == 200);
    CHECK(row.min_ms() == 1);
    CHECK(row.max_ms() == 100);
    CHECK(row.percentile_ms(10) == 10);
    CHECK(row.percentile_ms(50) == 50);
    CHECK(row.percentile_ms(99) == 99);
    CHECK(row.stddev_ms() == Approx(28.866).epsilon(0.001));
    CHECK(row.completion_percent() == Approx(50.0));
    CHECK(row.requests_per_sec() == Approx(50.0));
}

TEST_CASE("RequestStats without samples", "[scenario][stats]") {
    RequestStats row(800, 1000, metrics::Histogram{}, 5.0);

    CHECK(row.samples() == 0);
    CHECK(row.min_ms() == 0);
    CHECK(row.max_ms() == 0);
    CHECK(row.stddev_ms() == 0.0);
    CHECK(row.percentile_ms(90) == 0);
    CHECK(row.completion_percent() == 0.0);
    CHECK(row.requests_per_sec() == 0.0);

    SECTION("Zero duration and zero attempts do not divide by zero") {
        RequestStats empty;
        CHECK(empty.completion_percent() == 0.0);
        CHECK(empty.requests_per_sec() == 0.0);
    }
}

TEST_CASE("RequestsTable::ToString", "[scenario][stats]") {
    RequestsTable table;
    CHECK(table.empty());

    table.add_row(RequestStats(1, 100, OneToHundred(), 0.5));
    table.add_row(RequestStats(800, 1000, metrics::Histogram{}, 12.25));
    REQUIRE(table.rows().size() == 2);

    auto lines = Lines(table.ToString());
    // separator, header, separator, two rows, separator
    REQUIRE(lines.size() == 6);
    CHECK(lines[0] == lines[2]);
    CHECK(lines[0] == lines[5]);
    CHECK(lines[0].front() == '+');

    // Every line has the same width
    for (const auto& line : lines) {
        CHECK(line.size() == lines[0].size());
    }

    CHECK(lines[1].find("| peers |") == 0);
    CHECK(lines[1].find("completion %") != std::string::npos);
    CHECK(lines[1].find("requests/s") != std::string::npos);

    CHECK(lines[3].find("100.00") != std::string::npos);  // completion
    CHECK(lines[3].find("200.00") != std::string::npos);  // requests/s
    CHECK(lines[4].find("   800 |") != std::string::npos);
    CHECK(lines[4].find("12.25") != std::string::npos);
}

TEST_CASE("RequestsTable::ToJson", "[scenario][stats][json]") {
    RequestsTable table;
    table.add_row(RequestStats(4, 25, OneToHundred(), 1.0));

    auto j = json::parse(table.ToJson());
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    CHECK(j[0]["peers"] == 4);
    CHECK(j[0]["requests"] == 25);
    CHECK(j[0]["samples"] == 100);
    CHECK(j[0]["p50_ms"] == 50);
    CHECK(j[0]["p99_ms"] == 99);
    CHECK(j[0]["completion_percent"].get<double>() == Approx(100.0));
    CHECK(j[0]["requests_per_sec"].get<double>() == Approx(100.0));
}
