#include <doctest/doctest.h>
#include <ocfg/partition_order.hpp>

#include "test_fs.hpp"

using namespace ocfg;
using ocfg::test::TempDir;

namespace {

constexpr const char* kDefaultOrder = "system, vendor, odm, oem, product, system_ext";

std::string order_file(const TempDir& tmp) {
    return tmp.file(kPartitionOrderRelativePath);
}

} // namespace

// ============================================================================
// sort_partitions (in-place)
// ============================================================================

TEST_CASE("sort_partitions without override file keeps default order") {
    TempDir tmp;
    auto partitions = make_partitions(tmp.path());

    CHECK_FALSE(sort_partitions(order_file(tmp), partitions));
    CHECK(render_partition_order(partitions) == kDefaultOrder);
}

TEST_CASE("sort_partitions rejects wrong root element") {
    TempDir tmp;
    auto partitions = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath,
              "<partition-list>\n"
              "  <partition name=\"system_ext\"/>\n"
              "  <partition name=\"vendor\"/>\n"
              "  <partition name=\"oem\"/>\n"
              "  <partition name=\"odm\"/>\n"
              "  <partition name=\"product\"/>\n"
              "  <partition name=\"system\"/>\n"
              "</partition-list>\n");

    CHECK_FALSE(sort_partitions(order_file(tmp), partitions));
    CHECK(render_partition_order(partitions) == kDefaultOrder);
}

TEST_CASE("sort_partitions rejects unknown partition name") {
    TempDir tmp;
    auto partitions = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order>\n"
              "  <partition name=\"INVALID\"/>\n"
              "  <partition name=\"vendor\"/>\n"
              "  <partition name=\"oem\"/>\n"
              "  <partition name=\"odm\"/>\n"
              "  <partition name=\"product\"/>\n"
              "  <partition name=\"system\"/>\n"
              "</partition-order>\n");

    CHECK_FALSE(sort_partitions(order_file(tmp), partitions));
    CHECK(render_partition_order(partitions) == kDefaultOrder);
}

TEST_CASE("sort_partitions rejects duplicate partition") {
    TempDir tmp;
    auto partitions = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order>\n"
              "  <partition name=\"system_ext\"/>\n"
              "  <partition name=\"system\"/>\n"
              "  <partition name=\"vendor\"/>\n"
              "  <partition name=\"oem\"/>\n"
              "  <partition name=\"odm\"/>\n"
              "  <partition name=\"product\"/>\n"
              "  <partition name=\"system\"/>\n"
              "</partition-order>\n");

    CHECK_FALSE(sort_partitions(order_file(tmp), partitions));
    CHECK(render_partition_order(partitions) == kDefaultOrder);
}

TEST_CASE("sort_partitions rejects missing partition") {
    TempDir tmp;
    auto partitions = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order>\n"
              "  <partition name=\"vendor\"/>\n"
              "  <partition name=\"oem\"/>\n"
              "  <partition name=\"odm\"/>\n"
              "  <partition name=\"product\"/>\n"
              "  <partition name=\"system\"/>\n"
              "</partition-order>\n");

    CHECK_FALSE(sort_partitions(order_file(tmp), partitions));
    CHECK(render_partition_order(partitions) == kDefaultOrder);
}

TEST_CASE("sort_partitions applies a complete override") {
    TempDir tmp;
    auto partitions = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order>\n"
              "  <partition name=\"system_ext\"/>\n"
              "  <partition name=\"vendor\"/>\n"
              "  <partition name=\"oem\"/>\n"
              "  <partition name=\"odm\"/>\n"
              "  <partition name=\"product\"/>\n"
              "  <partition name=\"system\"/>\n"
              "</partition-order>\n");

    CHECK(sort_partitions(order_file(tmp), partitions));
    CHECK(render_partition_order(partitions) == "system_ext, vendor, oem, odm, product, system");
    CHECK(is_complete_partition_order(partitions));
}

// ============================================================================
// resolve_partition_order (copy on success)
// ============================================================================

TEST_CASE("resolve_partition_order accepted result leaves input untouched") {
    TempDir tmp;
    const auto defaults = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order>"
              "<partition name=\"system_ext\"/><partition name=\"vendor\"/>"
              "<partition name=\"oem\"/><partition name=\"odm\"/>"
              "<partition name=\"product\"/><partition name=\"system\"/>"
              "</partition-order>");

    auto result = resolve_partition_order(order_file(tmp), defaults);
    CHECK(result.accepted);
    CHECK(result.reason.empty());
    CHECK(render_partition_order(result.order) == "system_ext, vendor, oem, odm, product, system");
    CHECK(render_partition_order(defaults) == kDefaultOrder);

    // Reordered entries keep their identity and roots
    REQUIRE(result.order.size() == defaults.size());
    CHECK(result.order[0] == defaults[5]);
    CHECK(result.order[5] == defaults[0]);
}

TEST_CASE("resolve_partition_order rejection returns the default order") {
    TempDir tmp;
    const auto defaults = make_partitions(tmp.path());

    auto result = resolve_partition_order(order_file(tmp), defaults);
    CHECK_FALSE(result.accepted);
    CHECK(result.order == defaults);
    CHECK_FALSE(result.reason.empty());
}

TEST_CASE("resolve_partition_order rejects extra unknown entry with full set") {
    TempDir tmp;
    const auto defaults = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order>"
              "<partition name=\"system\"/><partition name=\"vendor\"/>"
              "<partition name=\"odm\"/><partition name=\"oem\"/>"
              "<partition name=\"product\"/><partition name=\"system_ext\"/>"
              "<partition name=\"apex\"/>"
              "</partition-order>");

    auto result = resolve_partition_order(order_file(tmp), defaults);
    CHECK_FALSE(result.accepted);
    CHECK(result.reason.find("apex") != std::string::npos);
}

TEST_CASE("resolve_partition_order is case-sensitive on names") {
    TempDir tmp;
    const auto defaults = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order>"
              "<partition name=\"SYSTEM\"/><partition name=\"vendor\"/>"
              "<partition name=\"odm\"/><partition name=\"oem\"/>"
              "<partition name=\"product\"/><partition name=\"system_ext\"/>"
              "</partition-order>");

    CHECK_FALSE(resolve_partition_order(order_file(tmp), defaults).accepted);
}

TEST_CASE("resolve_partition_order rejects malformed XML") {
    TempDir tmp;
    const auto defaults = make_partitions(tmp.path());
    tmp.write(kPartitionOrderRelativePath, "<partition-order><partition name=\"system\">");

    auto result = resolve_partition_order(order_file(tmp), defaults);
    CHECK_FALSE(result.accepted);
    CHECK(result.order == defaults);
}

// ============================================================================
// parse_partition_order_file (structure)
// ============================================================================

TEST_CASE("parse_partition_order_file rejects foreign child elements") {
    TempDir tmp;
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order><partition name=\"system\"/><item name=\"vendor\"/></partition-order>");

    auto parsed = parse_partition_order_file(order_file(tmp));
    CHECK_FALSE(parsed.ok);
    CHECK(parsed.error.find("item") != std::string::npos);
}

TEST_CASE("parse_partition_order_file rejects entry without name") {
    TempDir tmp;
    tmp.write(kPartitionOrderRelativePath,
              "<partition-order><partition/></partition-order>");

    CHECK_FALSE(parse_partition_order_file(order_file(tmp)).ok);
}

TEST_CASE("parse_partition_order_file ignores comments and whitespace") {
    TempDir tmp;
    tmp.write(kPartitionOrderRelativePath,
              "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
              "<!-- vendor first -->\n"
              "<partition-order>\n"
              "  <!-- comment -->\n"
              "  <partition name=\"vendor\"/>\n"
              "  <partition name=\"system\"/>\n"
              "</partition-order>\n");

    auto parsed = parse_partition_order_file(order_file(tmp));
    REQUIRE(parsed.ok);
    REQUIRE(parsed.names.size() == 2);
    CHECK(parsed.names[0] == "vendor");
    CHECK(parsed.names[1] == "system");
}
