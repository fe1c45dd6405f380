#include <vmplace/core/host_pool.hpp>
#include <vmplace/core/error.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace vmplace::core;

class HostPoolTest : public ::testing::Test {
protected:
    HostPool pool_{std::vector<Host>{
        {"H1", 92.0, 114.0, 0.5986, 0.3664},
        {"H2", 63.0, 102.0, 0.635, 0.3325},
        {"H3", 79.0, 116.0, 0.532, 0.7336},
    }};
};

TEST_F(HostPoolTest, KeepsInsertionOrder) {
    auto hosts = pool_.list_candidates();
    ASSERT_EQ(hosts.size(), 3U);
    EXPECT_EQ(hosts[0].host_id, "H1");
    EXPECT_EQ(hosts[1].host_id, "H2");
    EXPECT_EQ(hosts[2].host_id, "H3");
}

TEST_F(HostPoolTest, AddHostReturnsIndex) {
    auto idx = pool_.add_host({"H4", 78.0, 100.0, 1.0421, 0.3826});
    EXPECT_EQ(idx, 3U);
    EXPECT_EQ(pool_.size(), 4U);
    EXPECT_EQ(pool_.list_candidates().back().host_id, "H4");
}

TEST_F(HostPoolTest, FindById) {
    EXPECT_EQ(pool_.find("H2"), 1U);
    EXPECT_FALSE(pool_.find("H9").has_value());
}

// Views into a larger buffer, as the loaders and tools hand them over
TEST_F(HostPoolTest, FindByViewWithoutTerminator) {
    const std::string line = "H3,H1,H22";
    std::string_view view(line);
    EXPECT_EQ(pool_.find(view.substr(0, 2)), 2U);
    EXPECT_EQ(pool_.find(view.substr(3, 2)), 0U);
    EXPECT_FALSE(pool_.find(view.substr(6, 3)).has_value());
    EXPECT_FALSE(pool_.find(view.substr(0, 1)).has_value());
    EXPECT_EQ(pool_.host(view.substr(6, 2)).host_id, "H2");
}

TEST_F(HostPoolTest, AccessByIdAndIndex) {
    EXPECT_EQ(pool_.host(2).host_id, "H3");
    EXPECT_DOUBLE_EQ(pool_.host("H2").cpu_capacity, 63.0);
    EXPECT_THROW((void)pool_.host(3), OutOfRangeError);
    EXPECT_THROW((void)pool_.host("nope"), UnknownHostError);
}

TEST_F(HostPoolTest, DebitReducesOnlyTargetHost) {
    pool_.debit("H2", 16.0, 20.0);

    EXPECT_DOUBLE_EQ(pool_.host("H2").cpu_capacity, 47.0);
    EXPECT_DOUBLE_EQ(pool_.host("H2").ram_capacity, 82.0);
    EXPECT_DOUBLE_EQ(pool_.host("H1").cpu_capacity, 92.0);
    EXPECT_DOUBLE_EQ(pool_.host("H1").ram_capacity, 114.0);
    EXPECT_DOUBLE_EQ(pool_.host("H3").cpu_capacity, 79.0);
    EXPECT_DOUBLE_EQ(pool_.host("H3").ram_capacity, 116.0);
}

TEST_F(HostPoolTest, DebitToExactlyZeroIsAllowed) {
    pool_.debit_at(1, 63.0, 102.0);
    EXPECT_DOUBLE_EQ(pool_.host(1).cpu_capacity, 0.0);
    EXPECT_DOUBLE_EQ(pool_.host(1).ram_capacity, 0.0);
}

TEST_F(HostPoolTest, OverDebitThrowsAndLeavesHostUnchanged) {
    EXPECT_THROW(pool_.debit("H2", 64.0, 1.0), CapacityError);
    EXPECT_THROW(pool_.debit("H2", 1.0, 103.0), CapacityError);

    EXPECT_DOUBLE_EQ(pool_.host("H2").cpu_capacity, 63.0);
    EXPECT_DOUBLE_EQ(pool_.host("H2").ram_capacity, 102.0);
}

TEST_F(HostPoolTest, CapacityErrorCarriesDetails) {
    try {
        pool_.debit("H1", 10.0, 500.0);
        FAIL() << "expected CapacityError";
    } catch (const CapacityError& e) {
        EXPECT_EQ(e.host_id(), "H1");
        EXPECT_EQ(e.resource(), "ram");
        EXPECT_DOUBLE_EQ(e.requested(), 500.0);
        EXPECT_DOUBLE_EQ(e.available(), 114.0);
    }
}

TEST_F(HostPoolTest, NegativeDebitRejected) {
    EXPECT_THROW(pool_.debit("H1", -1.0, 0.0), InvalidInputError);
    EXPECT_DOUBLE_EQ(pool_.host("H1").cpu_capacity, 92.0);
}

TEST_F(HostPoolTest, DebitUnknownHostThrows) {
    EXPECT_THROW(pool_.debit("H7", 1.0, 1.0), UnknownHostError);
    EXPECT_THROW(pool_.debit_at(7, 1.0, 1.0), OutOfRangeError);
}

TEST_F(HostPoolTest, DuplicateIdRejected) {
    EXPECT_THROW(pool_.add_host({"H1", 1.0, 1.0, 1.0, 1.0}), DuplicateHostError);
    EXPECT_EQ(pool_.size(), 3U);
}

TEST_F(HostPoolTest, InvalidHostsRejected) {
    EXPECT_THROW(pool_.add_host({"A", -1.0, 1.0, 1.0, 1.0}), InvalidInputError);
    EXPECT_THROW(pool_.add_host({"B", 1.0, -1.0, 1.0, 1.0}), InvalidInputError);
    EXPECT_THROW(pool_.add_host({"C", 1.0, 1.0, 0.0, 1.0}), InvalidInputError);
    EXPECT_THROW(pool_.add_host({"D", 1.0, 1.0, 1.0, 0.0}), InvalidInputError);
    EXPECT_THROW(pool_.add_host({"", 1.0, 1.0, 1.0, 1.0}), InvalidInputError);
    EXPECT_EQ(pool_.size(), 3U);
}

TEST_F(HostPoolTest, TotalCapacities) {
    EXPECT_DOUBLE_EQ(pool_.total_cpu_capacity(), 92.0 + 63.0 + 79.0);
    EXPECT_DOUBLE_EQ(pool_.total_ram_capacity(), 114.0 + 102.0 + 116.0);
}

TEST(HostPoolEmptyTest, EmptyPool) {
    HostPool pool;
    EXPECT_TRUE(pool.empty());
    EXPECT_TRUE(pool.list_candidates().empty());
    EXPECT_DOUBLE_EQ(pool.total_cpu_capacity(), 0.0);
}
