#include <dispatch/common/exceptions.hpp>
#include <dispatch/invoker/config.hpp>

#include <sstream>

#include <gtest/gtest.h>

using namespace dispatch::invoker;
namespace common = dispatch::common;

TEST(InvokerConfig, Defaults)
{
  std::stringstream stream{"{}"};

  auto cfg = config::Invoker::deserialize(stream);

  EXPECT_FALSE(cfg.verbose);
  EXPECT_EQ(cfg.instrumentation, config::Invoker::DEFAULT_INSTRUMENTATION);
  EXPECT_EQ(cfg.cancelled_event, CancelledEvent::NONE);
  EXPECT_EQ(cfg.callback_threads, config::Invoker::DEFAULT_CALLBACK_THREADS);

  auto empty = config::Invoker::deserialize(std::string{});
  EXPECT_EQ(empty.instrumentation, config::Invoker::DEFAULT_INSTRUMENTATION);
}

TEST(InvokerConfig, FullConfig)
{
  std::string config = R"(
    {
      "verbose": true,
      "instrumentation": false,
      "cancelled-event": "failed",
      "callback-threads": 4
    }
  )";
  std::stringstream stream{config};

  auto cfg = config::Invoker::deserialize(stream);

  EXPECT_TRUE(cfg.verbose);
  EXPECT_FALSE(cfg.instrumentation);
  EXPECT_EQ(cfg.cancelled_event, CancelledEvent::FAILED);
  EXPECT_EQ(cfg.callback_threads, 4);

  auto options = cfg.options();
  EXPECT_FALSE(options.instrumentation);
  EXPECT_EQ(options.cancelled_event, CancelledEvent::FAILED);
}

TEST(InvokerConfig, PartialConfig)
{
  std::string config = R"(
    {
      "cancelled-event": "cancelled"
    }
  )";
  std::stringstream stream{config};

  auto cfg = config::Invoker::deserialize(stream);

  EXPECT_TRUE(cfg.instrumentation);
  EXPECT_EQ(cfg.cancelled_event, CancelledEvent::CANCELLED);
  EXPECT_EQ(cfg.callback_threads, 0);
}

TEST(InvokerConfig, InvalidValues)
{
  std::stringstream unknown_policy{R"({"cancelled-event": "ignore"})"};
  EXPECT_THROW(config::Invoker::deserialize(unknown_policy), common::InvalidConfigurationError);

  std::stringstream negative_threads{R"({"callback-threads": -2})"};
  EXPECT_THROW(config::Invoker::deserialize(negative_threads), common::InvalidConfigurationError);

  std::stringstream wrong_type{R"({"instrumentation": "yes"})"};
  EXPECT_THROW(config::Invoker::deserialize(wrong_type), common::InvalidConfigurationError);
}

TEST(InvokerConfig, MalformedJson)
{
  std::stringstream stream{"{ \"verbose\": "};
  EXPECT_THROW(config::Invoker::deserialize(stream), common::InvalidConfigurationError);

  EXPECT_THROW(
      config::Invoker::deserialize(std::string{"/nonexistent/invoker.json"}),
      common::InvalidConfigurationError
  );
}
