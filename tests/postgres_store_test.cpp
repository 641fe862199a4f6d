#include <gtest/gtest.h>
#include "kvsession/db_config.hpp"
#include "kvsession/db_pool.hpp"
#include "kvsession/errors.hpp"
#include "kvsession/postgres_store.hpp"
#include "kvsession/session_codec.hpp"
#include "kvsession/session_lifecycle.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <pqxx/pqxx>
#include <unistd.h>

using namespace kvsession;
using kvsession::testing::ManualClock;

class PostgresStoreTest : public ::testing::Test
    {
    protected:
        void SetUp() override
            {
            auto config = db::Config::from_env();
            config.pool_size = 2;
            try
                {
                pool_ = std::make_shared<db::ConnectionPool>(config);
                }
                catch (const std::exception& e)
                    {
                    GTEST_SKIP() << "Database not available: " << e.what();
                    }

            table_ = "kvsession_test_" + std::to_string(getpid());
            store_ = std::make_unique<PostgresStore>(pool_, table_);
            store_->ensure_schema();
            }

        void TearDown() override
            {
            if (pool_)
                {
                auto conn = pool_->acquire();
                pqxx::work txn(conn.get());
                txn.exec("DROP TABLE IF EXISTS " + conn.get().quote_name(table_));
                txn.commit();
                }
            store_.reset();
            pool_.reset();
            }

        std::shared_ptr<db::ConnectionPool> pool_;
        std::unique_ptr<PostgresStore> store_;
        std::string table_;
    };

TEST_F(PostgresStoreTest, PoolHandsOutAndReclaimsConnections)
    {
    size_t initial = pool_->available();
    {
    auto conn = pool_->acquire();
    EXPECT_TRUE(conn.get().is_open());
    EXPECT_EQ(pool_->available(), initial - 1);
    }
    EXPECT_EQ(pool_->available(), initial);
    }

TEST_F(PostgresStoreTest, PutGetAndOverwrite)
    {
    EXPECT_EQ(store_->put("1a2b_3e8", "first"), "1a2b_3e8");
    EXPECT_EQ(store_->get("1a2b_3e8"), "first");

    store_->put("1a2b_3e8", "second");
    EXPECT_EQ(store_->get("1a2b_3e8"), "second");
    }

TEST_F(PostgresStoreTest, MissingKeyAndIdempotentDelete)
    {
    EXPECT_THROW(store_->get("absent"), KeyNotFound);

    store_->put("k", "v");
    EXPECT_NO_THROW(store_->del("k"));
    EXPECT_NO_THROW(store_->del("k"));
    EXPECT_THROW(store_->get("k"), KeyNotFound);
    }

TEST_F(PostgresStoreTest, KeysListsEverything)
    {
    store_->put("b", "2");
    store_->put("a", "1");

    auto keys = store_->keys();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{ "a", "b" }));
    }

TEST_F(PostgresStoreTest, SessionsRoundTripAndExpire)
    {
    ManualClock clock(1700000000);
    SessionContext context("s3cr3t", std::make_shared<SystemRandomSource>(), "sha256", 64, clock.fn());
    SessionCodec codec(context, *store_);
    SessionLifecycle lifecycle(context, *store_);

    Session session;
    session.set("user", "alice");
    std::string token = codec.serialize(session, from_epoch_seconds(clock.epoch() + 30));
    EXPECT_EQ(codec.deserialize(token).get<std::string>("user"), "alice");

    clock.advance(30);
    EXPECT_EQ(lifecycle.cleanup_sessions(), 1u);
    EXPECT_TRUE(store_->keys().empty());
    }
