/* SPDX-License-Identifier: GPL-3.0-only */
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <type_traits>
#include <vector>

#include <fcntl.h>

#include <gtest/gtest.h>

#include "pidset/PidSet.hpp"
#include "pidset/PidSetError.hpp"
#include "pidset/system/ExitEvent.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace pidset;
using PID = PidSet::PID;
using Token = PidSet::Token;

namespace
{

/// The behaviour of the fake backend, and the record of what the monitor did
/// with it.
struct Script
{
  bool FailCreate = false;
  bool FailClose = false;
  std::set<PID> NoSuchProcess;
  std::set<PID> FailAttach;
  std::set<PID> FailDetach;

  /// Every \p wait() consumes the first batch. An empty batch is an
  /// interrupted wait.
  std::deque<std::vector<Token>> Batches;

  std::size_t Creates = 0;
  std::size_t Acquires = 0;
  std::size_t Closes = 0;
  std::vector<std::size_t> WaitCapacities;
  std::vector<PID> AttachCalls;
  std::vector<PID> DetachCalls;
  /// The registrations currently alive in the multiplexer.
  std::map<PID, Token> Registered;
};

class FakeMultiplexer : public system::ExitMultiplexer
{
public:
  explicit FakeMultiplexer(std::shared_ptr<Script> S) : S(std::move(S)) {}

  void attach(const system::ExitHandle& H, Token T) override
  {
    S->AttachCalls.emplace_back(H.pid());
    EXPECT_TRUE(H.has()) << "Attaching an empty handle";
    if (S->FailAttach.count(H.pid()))
      throw PidSetError{PidSetErrc::AttachFailed,
                        std::make_error_code(std::errc::no_space_on_device),
                        "fake attach",
                        H.pid()};
    EXPECT_TRUE(S->Registered.try_emplace(H.pid(), T).second)
      << "PID " << H.pid() << " attached twice";
  }

  void detach(const system::ExitHandle& H) override
  {
    S->DetachCalls.emplace_back(H.pid());
    EXPECT_EQ(S->Registered.erase(H.pid()), 1)
      << "PID " << H.pid() << " detached without being attached";
    if (S->FailDetach.count(H.pid()))
      throw PidSetError{PidSetErrc::DetachFailed,
                        std::make_error_code(std::errc::no_such_file_or_directory),
                        "fake detach",
                        H.pid()};
  }

  std::size_t wait(std::size_t MaxEvents) override
  {
    S->WaitCapacities.emplace_back(MaxEvents);
    if (S->Batches.empty())
    {
      ADD_FAILURE() << "wait() called, but no exits were scripted";
      throw PidSetError{PidSetErrc::WaitFailed,
                        std::make_error_code(std::errc::timed_out),
                        "script exhausted"};
    }

    Last = std::move(S->Batches.front());
    S->Batches.pop_front();
    if (Last.size() > MaxEvents)
    {
      // The rest of the batch is reported by the next wait.
      S->Batches.emplace_front(Last.begin() + MaxEvents, Last.end());
      Last.resize(MaxEvents);
    }
    return Last.size();
  }

  Token tokenAt(std::size_t Index) const override { return Last.at(Index); }

  void close() override
  {
    ++S->Closes;
    if (S->FailClose)
      throw PidSetError{PidSetErrc::MultiplexerCloseFailed,
                        std::make_error_code(std::errc::io_error),
                        "fake close"};
  }

private:
  std::shared_ptr<Script> S;
  std::vector<Token> Last;
};

class FakeSource : public system::ExitEventSource
{
public:
  explicit FakeSource(std::shared_ptr<Script> S) : S(std::move(S)) {}

  std::unique_ptr<system::ExitMultiplexer>
  createMultiplexer(std::size_t /*Capacity*/) override
  {
    ++S->Creates;
    if (S->FailCreate)
      throw PidSetError{PidSetErrc::MultiplexerCreateFailed,
                        std::make_error_code(std::errc::too_many_files_open),
                        "fake create"};
    return std::make_unique<FakeMultiplexer>(S);
  }

  system::ExitHandle acquire(PID Pid) override
  {
    ++S->Acquires;
    if (S->NoSuchProcess.count(Pid))
      throw PidSetError{PidSetErrc::ProcessLookupFailed,
                        std::make_error_code(std::errc::no_such_process),
                        "fake lookup",
                        Pid};

    // Any real descriptor will do, the fake never waits on it.
    int FD = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    EXPECT_NE(FD, -1);
    return system::ExitHandle{Pid, system::Handle::wrap(FD)};
  }

private:
  std::shared_ptr<Script> S;
};

std::unique_ptr<system::ExitEventSource>
makeSource(const std::shared_ptr<Script>& S)
{
  return std::make_unique<FakeSource>(S);
}

template <typename Fn>
std::optional<PidSetError> errorOf(Fn&& F) // NOLINT
{
  try
  {
    F();
  }
  catch (const PidSetError& E)
  {
    return E;
  }
  return std::nullopt;
}

} // namespace

static_assert(!std::is_convertible_v<std::initializer_list<PID>, PidSet>,
              "A brace list of PIDs must not silently become a monitor");
static_assert(!std::is_convertible_v<std::vector<PID>, PidSet>,
              "A container of PIDs must not silently become a monitor");
static_assert(std::is_constructible_v<PidSet, std::initializer_list<PID>>);

TEST(PidSet, ConstructionIsLazy)
{
  auto S = std::make_shared<Script>();
  PidSet Set({10, 20, 30}, makeSource(S));

  EXPECT_EQ(Set.size(), 3);
  EXPECT_FALSE(Set.isInitialized());
  EXPECT_EQ(S->Creates, 0);
  EXPECT_EQ(S->Acquires, 0);
}

TEST(PidSet, ExplicitInitializeRegistersEverything)
{
  auto S = std::make_shared<Script>();
  PidSet Set({30, 10, 20}, makeSource(S));
  Set.initialize();

  EXPECT_TRUE(Set.isInitialized());
  EXPECT_EQ(S->Creates, 1);
  EXPECT_EQ(S->Acquires, 3);
  ASSERT_EQ(S->Registered.size(), 3);
  for (const auto& R : S->Registered)
    EXPECT_EQ(R.second, static_cast<Token>(R.first));

  // A second call is a no-op.
  Set.initialize();
  EXPECT_EQ(S->Creates, 1);
}

TEST(PidSet, WaitAnyConsumesWholeBatch)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({10, 20});
  PidSet Set({10, 20, 30}, makeSource(S));

  EXPECT_EQ(Set.waitAny(), 2);
  EXPECT_EQ(Set.size(), 1);
  EXPECT_EQ(Set.pids(), std::vector<PID>{30});
  EXPECT_EQ(S->DetachCalls, (std::vector<PID>{10, 20}));
  EXPECT_EQ(S->Registered.size(), 1);
}

TEST(PidSet, WaitNSpansBatchesAndInterruptions)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({10});
  S->Batches.push_back({});
  S->Batches.push_back({30});
  PidSet Set({10, 20, 30}, makeSource(S));

  EXPECT_EQ(Set.waitN(2), 2);
  EXPECT_EQ(S->WaitCapacities, (std::vector<std::size_t>{3, 2, 2}));
  EXPECT_EQ(Set.pids(), std::vector<PID>{20});
}

TEST(PidSet, WaitNOvershootsWithinBatch)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({10});
  S->Batches.push_back({20, 30, 40});
  PidSet Set({10, 20, 30, 40}, makeSource(S));

  EXPECT_EQ(Set.waitN(2), 4);
  EXPECT_TRUE(Set.empty());
}

TEST(PidSet, WaitAllDrainsToEmpty)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({20});
  S->Batches.push_back({10, 30});
  PidSet Set({10, 20, 30}, makeSource(S));

  EXPECT_EQ(Set.waitAll(), 3);
  EXPECT_TRUE(Set.empty());
  EXPECT_TRUE(S->Registered.empty());

  // Nothing left, nothing to block on.
  EXPECT_EQ(Set.waitAll(), 0);
  EXPECT_EQ(S->WaitCapacities.size(), 2);
}

TEST(PidSet, ExitReportedOnlyOnce)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({10});
  S->Batches.push_back({20});
  PidSet Set({10, 20}, makeSource(S));

  EXPECT_EQ(Set.waitAny(), 1);
  EXPECT_FALSE(Set.contains(10));
  EXPECT_EQ(Set.waitAny(), 1);
  EXPECT_FALSE(Set.contains(20));
  EXPECT_EQ(S->DetachCalls, (std::vector<PID>{10, 20}));
  EXPECT_EQ(S->Creates, 1);
}

TEST(PidSet, WaitZero)
{
  auto S = std::make_shared<Script>();
  PidSet Set({10}, makeSource(S));

  EXPECT_EQ(Set.waitN(0), 0);
  EXPECT_TRUE(Set.isInitialized());
  EXPECT_EQ(Set.size(), 1);
  EXPECT_TRUE(S->WaitCapacities.empty());
}

TEST(PidSet, EmptySet)
{
  auto S = std::make_shared<Script>();
  PidSet Set(std::vector<PID>{}, makeSource(S));

  EXPECT_TRUE(Set.empty());
  EXPECT_EQ(Set.waitAll(), 0);
  EXPECT_TRUE(S->WaitCapacities.empty());

  auto E = errorOf([&Set] { (void)Set.waitAny(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::WaitCountExceedsTracked);
}

TEST(PidSet, WaitCountExceedsTracked)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({10});
  PidSet Set({10, 20}, makeSource(S));

  auto E = errorOf([&Set] { (void)Set.waitN(3); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::WaitCountExceedsTracked);
  EXPECT_EQ(E->code(), std::errc::invalid_argument);
  EXPECT_FALSE(Set.isInitialized());

  EXPECT_EQ(Set.waitAny(), 1);
  E = errorOf([&Set] { (void)Set.waitN(2); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::WaitCountExceedsTracked);
  EXPECT_EQ(Set.size(), 1);
}

TEST(PidSet, DuplicatesCollapse)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({10, 20});
  PidSet Set({10, 10, 20}, makeSource(S));

  EXPECT_EQ(Set.size(), 2);
  EXPECT_EQ(Set.waitAll(), 2);
  EXPECT_EQ(S->Acquires, 2);
}

TEST(PidSet, UnknownToken)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({10, 99});
  PidSet Set({10, 20}, makeSource(S));

  auto E = errorOf([&Set] { (void)Set.waitAny(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::UnknownToken);
  EXPECT_EQ(E->token(), Token{99});
  EXPECT_EQ(E->code(), std::errc::protocol_error);

  // The exit consumed before the error stays consumed.
  EXPECT_FALSE(Set.contains(10));
  EXPECT_TRUE(Set.contains(20));
}

TEST(PidSet, TokenOutOfPIDRange)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({~Token{0}});
  PidSet Set({10}, makeSource(S));

  auto E = errorOf([&Set] { (void)Set.waitAny(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::UnknownToken);
  EXPECT_EQ(Set.size(), 1);
}

TEST(PidSet, DetachFailureDuringDrainIsNotFatal)
{
  auto S = std::make_shared<Script>();
  S->FailDetach.insert(10);
  S->Batches.push_back({10});
  PidSet Set({10, 20}, makeSource(S));

  EXPECT_EQ(Set.waitAny(), 1);
  EXPECT_FALSE(Set.contains(10));
  EXPECT_TRUE(Set.contains(20));
}

TEST(PidSet, CreateFailure)
{
  auto S = std::make_shared<Script>();
  S->FailCreate = true;
  PidSet Set({10}, makeSource(S));

  auto E = errorOf([&Set] { Set.initialize(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::MultiplexerCreateFailed);
  EXPECT_EQ(E->code(), std::errc::too_many_files_open);
  EXPECT_EQ(S->Acquires, 0);
  EXPECT_FALSE(Set.isInitialized());
}

TEST(PidSet, NoBackend)
{
  PidSet Set({10}, nullptr);

  auto E = errorOf([&Set] { (void)Set.waitAny(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::MultiplexerCreateFailed);
}

TEST(PidSet, LookupFailureRollsBack)
{
  auto S = std::make_shared<Script>();
  S->NoSuchProcess.insert(20);
  PidSet Set({10, 20, 30}, makeSource(S));

  auto E = errorOf([&Set] { (void)Set.waitAny(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::ProcessLookupFailed);
  EXPECT_EQ(E->pid(), PID{20});
  EXPECT_EQ(E->code(), std::errc::no_such_process);

  EXPECT_FALSE(Set.isInitialized());
  EXPECT_TRUE(S->AttachCalls.empty());
  EXPECT_TRUE(S->Registered.empty());
  EXPECT_EQ(Set.size(), 3);

  // The failure is not sticky.
  S->NoSuchProcess.clear();
  Set.initialize();
  EXPECT_TRUE(Set.isInitialized());
  EXPECT_EQ(S->Registered.size(), 3);
}

TEST(PidSet, AttachFailureRollsBack)
{
  auto S = std::make_shared<Script>();
  S->FailAttach.insert(20);
  PidSet Set({10, 20, 30}, makeSource(S));

  auto E = errorOf([&Set] { Set.initialize(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::AttachFailed);
  EXPECT_EQ(E->pid(), PID{20});

  EXPECT_FALSE(Set.isInitialized());
  EXPECT_EQ(S->DetachCalls, std::vector<PID>{10});
  EXPECT_TRUE(S->Registered.empty());

  S->FailAttach.clear();
  Set.initialize();
  EXPECT_EQ(S->Registered.size(), 3);
  EXPECT_EQ(S->Creates, 2);
}

TEST(PidSet, RollbackKeepsOriginalError)
{
  auto S = std::make_shared<Script>();
  S->FailAttach.insert(30);
  S->FailDetach.insert(10);
  PidSet Set({10, 20, 30}, makeSource(S));

  auto E = errorOf([&Set] { Set.initialize(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::AttachFailed);
  EXPECT_EQ(E->pid(), PID{30});
  EXPECT_EQ(S->DetachCalls, (std::vector<PID>{10, 20}));
  EXPECT_FALSE(Set.isInitialized());
}

TEST(PidSet, CloseBeforeInitialisation)
{
  auto S = std::make_shared<Script>();
  PidSet Set({10}, makeSource(S));

  Set.close();
  EXPECT_TRUE(Set.isClosed());
  EXPECT_EQ(S->Creates, 0);
  EXPECT_EQ(S->Closes, 0);

  auto E = errorOf([&Set] { (void)Set.waitAny(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::UseAfterClose);

  E = errorOf([&Set] { Set.initialize(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::UseAfterClose);
}

TEST(PidSet, CloseIsIdempotent)
{
  auto S = std::make_shared<Script>();
  PidSet Set({10, 20}, makeSource(S));
  Set.initialize();

  Set.close();
  Set.close();
  EXPECT_EQ(S->Closes, 1);
  EXPECT_TRUE(Set.empty());
  EXPECT_FALSE(Set.isInitialized());

  auto E = errorOf([&Set] { (void)Set.waitAll(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::UseAfterClose);
}

TEST(PidSet, CloseFailureReported)
{
  auto S = std::make_shared<Script>();
  S->FailClose = true;
  PidSet Set({10}, makeSource(S));
  Set.initialize();

  auto E = errorOf([&Set] { Set.close(); });
  ASSERT_TRUE(E);
  EXPECT_EQ(E->kind(), PidSetErrc::MultiplexerCloseFailed);
  EXPECT_TRUE(Set.isClosed());

  EXPECT_FALSE(errorOf([&Set] { Set.close(); }));
  EXPECT_EQ(S->Closes, 1);
}

TEST(PidSet, Move)
{
  auto S = std::make_shared<Script>();
  S->Batches.push_back({20});
  PidSet Set({10, 20}, makeSource(S));
  Set.initialize();

  PidSet Other = std::move(Set);
  EXPECT_TRUE(Other.isInitialized());
  EXPECT_EQ(Other.waitAny(), 1);
  EXPECT_EQ(Other.pids(), std::vector<PID>{10});
  EXPECT_EQ(S->Creates, 1);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
