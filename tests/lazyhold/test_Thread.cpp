#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>

#include "lazyhold/common/Thread.hpp"

TEST(TestThread, DispatchReturnsResult)
{
  Thread th("adder");
  auto res = th.dispatch([](int a, int b) { return a + b; }, 2, 3);
  EXPECT_EQ(res.get(), 5);
}

TEST(TestThread, NameIsVisibleWhileRunning)
{
  Thread th("named-worker");
  auto res = th.dispatch([] { return Thread::name(std::this_thread::get_id()); });
  EXPECT_EQ(res.get(), "named-worker");

  th.join();
  EXPECT_FALSE(th.isJoinable());
}

TEST(TestThread, ExceptionReachesFuture)
{
  Thread th("thrower");
  auto res = th.dispatch([]() -> int { throw std::logic_error("bad"); });
  EXPECT_THROW(res.get(), std::logic_error);
}

TEST(TestThread, UnknownThreadIsUndefined)
{
  EXPECT_EQ(Thread::name(std::thread::id{}), "undefined");
  EXPECT_FALSE(Thread::include(std::thread::id{}));
}
