#include "core/session_store.h"

#include <thread>

#include "absl/time/clock.h"
#include "gtest/gtest.h"

#include "core/errors.h"

namespace geneflow {
namespace {

class SessionStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(db.Init(":memory:").ok());
    now = absl::FromUnixSeconds(1700000000);
    auto store_or = SessionStore::Create(&db, Options());
    ASSERT_TRUE(store_or.ok()) << store_or.status();
    store = std::move(*store_or);
  }

  SessionStoreOptions Options() {
    SessionStoreOptions options;
    options.clock = [this] {
      absl::MutexLock lock(&clock_mu);
      return now;
    };
    return options;
  }

  void Advance(absl::Duration d) {
    absl::MutexLock lock(&clock_mu);
    now += d;
  }

  Database db;
  absl::Mutex clock_mu;
  absl::Time now;
  std::unique_ptr<SessionStore> store;
};

TEST_F(SessionStoreTest, CreateAndGet) {
  auto created = store->CreateSession();
  ASSERT_TRUE(created.ok());
  EXPECT_EQ(created->owner_id, kAnonymousOwner);
  EXPECT_EQ(created->id.size(), 36);
  EXPECT_TRUE(created->active);

  Advance(absl::Seconds(5));
  auto fetched = store->Get(created->id);
  ASSERT_TRUE(fetched.ok());
  EXPECT_EQ(fetched->created_at, created->created_at);
  EXPECT_EQ(fetched->last_accessed, created->created_at + absl::Seconds(5));

  auto row = db.GetSession(created->id);
  ASSERT_TRUE(row.ok());
  EXPECT_EQ(row->last_accessed_micros, absl::ToUnixMicros(fetched->last_accessed));
}

TEST_F(SessionStoreTest, GetUnknownIsSessionNotFound) {
  auto result = store->Get("nope");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(GetErrorKind(result.status()), ErrorKind::kSessionNotFound);
}

TEST_F(SessionStoreTest, GetOrCreate) {
  auto fresh = store->GetOrCreate("", "alice");
  ASSERT_TRUE(fresh.ok());
  EXPECT_EQ(fresh->owner_id, "alice");

  auto same = store->GetOrCreate(fresh->id);
  ASSERT_TRUE(same.ok());
  EXPECT_EQ(same->id, fresh->id);

  auto replacement = store->GetOrCreate("unknown-id", "bob");
  ASSERT_TRUE(replacement.ok());
  EXPECT_NE(replacement->id, "unknown-id");
  EXPECT_EQ(replacement->owner_id, "bob");
}

TEST_F(SessionStoreTest, AppendMessagesInOrder) {
  auto s = store->CreateSession();
  ASSERT_TRUE(s.ok());
  ASSERT_TRUE(store->AppendMessage(s->id, Role::kUser, "hello").ok());
  Advance(absl::Seconds(1));
  ASSERT_TRUE(store->AppendMessage(s->id, Role::kAssistant, "hi", {{"error", false}}).ok());

  auto fetched = store->Get(s->id);
  ASSERT_TRUE(fetched.ok());
  ASSERT_EQ(fetched->messages.size(), 2);
  EXPECT_EQ(fetched->messages[0].content, "hello");
  EXPECT_EQ(fetched->messages[1].role, Role::kAssistant);
  EXPECT_EQ(fetched->messages[1].metadata["error"], false);
  EXPECT_LT(fetched->messages[0].timestamp, fetched->messages[1].timestamp);

  auto recent = store->RecentMessages(s->id, 1);
  ASSERT_TRUE(recent.ok());
  ASSERT_EQ(recent->size(), 1);
  EXPECT_EQ((*recent)[0].content, "hi");

  recent = store->RecentMessages(s->id, 10);
  ASSERT_TRUE(recent.ok());
  EXPECT_EQ(recent->size(), 2);
}

TEST_F(SessionStoreTest, AppendToUnknownSessionFails) {
  absl::Status status = store->AppendMessage("missing", Role::kUser, "x");
  EXPECT_EQ(GetErrorKind(status), ErrorKind::kSessionNotFound);
}

TEST_F(SessionStoreTest, Context) {
  auto s = store->CreateSession();
  ASSERT_TRUE(s.ok());
  ASSERT_TRUE(store->SetContext(s->id, "last_gc_percent", 42.5).ok());
  ASSERT_TRUE(store->SetContext(s->id, "organism", "E. coli").ok());

  auto value = store->GetContext(s->id, "last_gc_percent");
  ASSERT_TRUE(value.ok());
  EXPECT_DOUBLE_EQ(value->get<double>(), 42.5);

  auto all = store->GetContext(s->id);
  ASSERT_TRUE(all.ok());
  EXPECT_EQ(all->size(), 2);

  EXPECT_EQ(store->GetContext(s->id, "missing").status().code(), absl::StatusCode::kNotFound);
  EXPECT_FALSE(store->SetContext(s->id, "", 1).ok());
}

TEST_F(SessionStoreTest, SnapshotRoundTrip) {
  auto s = store->CreateSession("carol");
  ASSERT_TRUE(s.ok());
  ASSERT_TRUE(store->AppendMessage(s->id, Role::kUser, "ATGAAATAA").ok());
  ASSERT_TRUE(store->AppendMessage(s->id, Role::kSystem, "note", {{"k", {1, 2, 3}}}).ok());
  ASSERT_TRUE(store->SetContext(s->id, "nested", {{"a", 1}, {"b", "two"}}).ok());

  auto session = store->Get(s->id);
  ASSERT_TRUE(session.ok());
  auto restored = Session::FromSnapshot(session->ToSnapshot());
  ASSERT_TRUE(restored.ok()) << restored.status();
  EXPECT_EQ(restored->messages, session->messages);
  EXPECT_EQ(restored->context, session->context);
  EXPECT_EQ(restored->last_accessed, session->last_accessed);
  EXPECT_EQ(restored->owner_id, "carol");
}

TEST_F(SessionStoreTest, FromSnapshotRejectsMalformed) {
  EXPECT_FALSE(Session::FromSnapshot(nlohmann::json::array()).ok());
  EXPECT_FALSE(Session::FromSnapshot({{"id", "x"}}).ok());
  nlohmann::json bad_role = {{"id", "x"},
                             {"created_at", 0},
                             {"last_accessed", 0},
                             {"messages", {{{"role", "robot"}, {"content", "c"}, {"timestamp", 0}}}}};
  EXPECT_FALSE(Session::FromSnapshot(bad_role).ok());
}

TEST_F(SessionStoreTest, SoftDeleteKeepsRow) {
  auto s = store->CreateSession();
  ASSERT_TRUE(s.ok());
  ASSERT_TRUE(store->Delete(s->id).ok());

  EXPECT_EQ(GetErrorKind(store->Get(s->id).status()), ErrorKind::kSessionNotFound);
  auto row = db.GetSession(s->id);
  ASSERT_TRUE(row.ok());
  EXPECT_FALSE(row->active);
  EXPECT_EQ(store->Stats().total_sessions, 0);
}

TEST_F(SessionStoreTest, PurgeRemovesRow) {
  auto s = store->CreateSession();
  ASSERT_TRUE(s.ok());
  ASSERT_TRUE(store->Delete(s->id).ok());
  ASSERT_TRUE(store->Purge(s->id).ok());
  EXPECT_EQ(db.GetSession(s->id).status().code(), absl::StatusCode::kNotFound);
}

TEST_F(SessionStoreTest, SweepExpiredIsIdempotent) {
  auto old_session = store->CreateSession();
  ASSERT_TRUE(old_session.ok());
  Advance(absl::Hours(20));
  auto young_session = store->CreateSession();
  ASSERT_TRUE(young_session.ok());
  Advance(absl::Hours(5));

  auto removed = store->SweepExpired(absl::Hours(24));
  ASSERT_EQ(removed.size(), 1);
  EXPECT_EQ(removed[0], old_session->id);
  EXPECT_TRUE(store->SweepExpired(absl::Hours(24)).empty());

  EXPECT_EQ(db.GetSession(old_session->id).status().code(), absl::StatusCode::kNotFound);
  EXPECT_TRUE(store->Get(young_session->id).ok());
}

TEST_F(SessionStoreTest, SweepSkipsDeletedSessions) {
  auto s = store->CreateSession();
  ASSERT_TRUE(s.ok());
  ASSERT_TRUE(store->Delete(s->id).ok());
  Advance(absl::Hours(48));
  EXPECT_TRUE(store->SweepExpired().empty());
  auto row = db.GetSession(s->id);
  ASSERT_TRUE(row.ok());
}

TEST_F(SessionStoreTest, Stats) {
  auto a = store->CreateSession();
  auto b = store->CreateSession();
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(b.ok());
  ASSERT_TRUE(store->AppendMessage(a->id, Role::kUser, "1").ok());
  ASSERT_TRUE(store->AppendMessage(a->id, Role::kAssistant, "2").ok());
  ASSERT_TRUE(store->AppendMessage(a->id, Role::kUser, "3").ok());
  Advance(absl::Hours(23));
  ASSERT_TRUE(store->Get(b->id).ok());
  Advance(absl::Hours(2));

  SessionStats stats = store->Stats();
  EXPECT_EQ(stats.total_sessions, 2);
  EXPECT_EQ(stats.active_today, 1);
  EXPECT_EQ(stats.total_messages, 3);
  EXPECT_DOUBLE_EQ(stats.avg_messages_per_session, 1.5);
}

TEST_F(SessionStoreTest, ReloadsActiveSessionsFromDatabase) {
  auto kept = store->CreateSession("dave");
  auto dropped = store->CreateSession();
  ASSERT_TRUE(kept.ok());
  ASSERT_TRUE(dropped.ok());
  ASSERT_TRUE(store->AppendMessage(kept->id, Role::kUser, "persist me").ok());
  ASSERT_TRUE(store->Delete(dropped->id).ok());

  auto reopened = SessionStore::Create(&db, Options());
  ASSERT_TRUE(reopened.ok());
  auto session = (*reopened)->Get(kept->id);
  ASSERT_TRUE(session.ok());
  ASSERT_EQ(session->messages.size(), 1);
  EXPECT_EQ(session->messages[0].content, "persist me");
  EXPECT_FALSE((*reopened)->Get(dropped->id).ok());
}

TEST_F(SessionStoreTest, ConcurrentAppendsAreNotLost) {
  auto s = store->CreateSession();
  ASSERT_TRUE(s.ok());
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 25; ++i) {
        EXPECT_TRUE(store->AppendMessage(s->id, Role::kUser, std::to_string(t * 100 + i)).ok());
      }
    });
  }
  for (auto& th : threads) th.join();

  auto session = store->Get(s->id);
  ASSERT_TRUE(session.ok());
  EXPECT_EQ(session->messages.size(), 100);
}

TEST_F(SessionStoreTest, ConcurrentAppendTimestampsFollowMessageOrder) {
  SessionStoreOptions options;
  // Every reading moves the clock forward by one millisecond.
  options.clock = [this] {
    absl::MutexLock lock(&clock_mu);
    now += absl::Milliseconds(1);
    return now;
  };
  auto ticking = SessionStore::Create(&db, options);
  ASSERT_TRUE(ticking.ok()) << ticking.status();
  auto s = (*ticking)->CreateSession();
  ASSERT_TRUE(s.ok());

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE((*ticking)->AppendMessage(s->id, Role::kUser, "m").ok());
      }
    });
  }
  for (auto& th : threads) th.join();

  auto session = (*ticking)->Get(s->id);
  ASSERT_TRUE(session.ok());
  ASSERT_EQ(session->messages.size(), 400);
  for (size_t i = 1; i < session->messages.size(); ++i) {
    EXPECT_LT(session->messages[i - 1].timestamp, session->messages[i].timestamp) << "message " << i;
  }
  EXPECT_LE(session->messages.back().timestamp, session->last_accessed);
}

}  // namespace
}  // namespace geneflow
