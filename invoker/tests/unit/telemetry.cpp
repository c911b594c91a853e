#include "mocks.hpp"
#include "services.hpp"

#include <dispatch/invoker/invoker.hpp>
#include <dispatch/invoker/telemetry.hpp>

#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

using testing::_;
using testing::Eq;
using testing::InSequence;
using testing::Return;

class InvokerTelemetry : public ::testing::Test {
protected:
  std::shared_ptr<TestService> service = std::make_shared<TestService>();

  std::shared_ptr<testing::NiceMock<MockTelemetry>> telemetry = make_telemetry();
};

TEST_F(InvokerTelemetry, CompletedSequence)
{
  Invoker invoker{bind("sum", &TestService::sum), telemetry};

  {
    InSequence seq;
    EXPECT_CALL(*telemetry, invoked(Eq("sum"), Eq("order-1")));
    EXPECT_CALL(*telemetry, completed(Eq("sum"), Eq("order-1"), _));
  }
  EXPECT_CALL(*telemetry, faulted).Times(0);
  EXPECT_CALL(*telemetry, failed).Times(0);
  EXPECT_CALL(*telemetry, cancelled).Times(0);

  EXPECT_TRUE(invoker.invoke(service, make_inputs({1, 2}), "order-1").get().succeeded());
}

TEST_F(InvokerTelemetry, InvokedPrecedesDispatch)
{
  Invoker invoker{bind("deferred", &TestService::deferred), telemetry};

  int calls_at_invoked = -1;
  EXPECT_CALL(*telemetry, invoked).WillOnce([&](std::string_view, std::string_view) {
    calls_at_invoked = service->calls.load();
  });
  EXPECT_CALL(*telemetry, completed).Times(0);

  auto pending = invoker.invoke(service, make_inputs({1, 2}));
  EXPECT_EQ(calls_at_invoked, 0);
  EXPECT_FALSE(pending.is_settled());

  testing::Mock::VerifyAndClearExpectations(telemetry.get());
  EXPECT_CALL(*telemetry, completed(Eq("deferred"), _, _)).Times(1);

  service->pending_value.set_value(3);
  EXPECT_TRUE(pending.get().succeeded());
}

TEST_F(InvokerTelemetry, FaultedSequence)
{
  Invoker invoker{dispatch::invoker::bind("find_order", &TestService::find_order), telemetry};

  {
    InSequence seq;
    EXPECT_CALL(*telemetry, invoked);
    EXPECT_CALL(*telemetry, faulted(Eq("find_order"), _, _));
  }
  EXPECT_CALL(*telemetry, completed).Times(0);
  EXPECT_CALL(*telemetry, failed).Times(0);

  EXPECT_EQ(invoker.invoke(service, make_inputs({5})).get().status(), Status::FAULTED);
}

TEST_F(InvokerTelemetry, FailedSequence)
{
  Invoker invoker{bind("explode", &TestService::explode), telemetry};

  {
    InSequence seq;
    EXPECT_CALL(*telemetry, invoked);
    EXPECT_CALL(*telemetry, failed(Eq("explode"), _, _));
  }
  EXPECT_CALL(*telemetry, completed).Times(0);
  EXPECT_CALL(*telemetry, faulted).Times(0);

  EXPECT_EQ(invoker.invoke(service, make_inputs({5})).get().status(), Status::FAILED);
}

TEST_F(InvokerTelemetry, CancelledWithoutEvent)
{
  Invoker invoker{bind("withdraw", &TestService::withdraw), telemetry};

  EXPECT_CALL(*telemetry, invoked);
  EXPECT_CALL(*telemetry, completed).Times(0);
  EXPECT_CALL(*telemetry, failed).Times(0);
  EXPECT_CALL(*telemetry, cancelled).Times(0);

  EXPECT_EQ(invoker.invoke(service, make_inputs({5})).get().status(), Status::CANCELLED);
}

TEST_F(InvokerTelemetry, CancelledEvent)
{
  Options options;
  options.cancelled_event = CancelledEvent::CANCELLED;
  Invoker invoker{bind("withdraw", &TestService::withdraw), telemetry, options};

  EXPECT_CALL(*telemetry, invoked);
  EXPECT_CALL(*telemetry, cancelled(Eq("withdraw"), _, _));
  EXPECT_CALL(*telemetry, failed).Times(0);

  EXPECT_EQ(invoker.invoke(service, make_inputs({5})).get().status(), Status::CANCELLED);
}

TEST_F(InvokerTelemetry, CancelledReportedAsFailure)
{
  Options options;
  options.cancelled_event = CancelledEvent::FAILED;
  Invoker invoker{bind("withdraw", &TestService::withdraw), telemetry, options};

  EXPECT_CALL(*telemetry, invoked);
  EXPECT_CALL(*telemetry, failed(Eq("withdraw"), _, _));
  EXPECT_CALL(*telemetry, cancelled).Times(0);

  // The outcome itself stays a cancellation.
  EXPECT_EQ(invoker.invoke(service, make_inputs({5})).get().status(), Status::CANCELLED);
}

TEST_F(InvokerTelemetry, InstrumentationDisabled)
{
  Options options;
  options.instrumentation = false;
  Invoker invoker{bind("sum", &TestService::sum), telemetry, options};

  EXPECT_CALL(*telemetry, invoked).Times(0);
  EXPECT_CALL(*telemetry, completed).Times(0);

  EXPECT_TRUE(invoker.invoke(service, make_inputs({1, 2})).get().succeeded());
}

TEST_F(InvokerTelemetry, SinkDisabled)
{
  ON_CALL(*telemetry, enabled()).WillByDefault(Return(false));
  Invoker invoker{bind("sum", &TestService::sum), telemetry};

  EXPECT_CALL(*telemetry, invoked).Times(0);
  EXPECT_CALL(*telemetry, completed).Times(0);

  EXPECT_TRUE(invoker.invoke(service, make_inputs({1, 2})).get().succeeded());
}

TEST_F(InvokerTelemetry, ThrowingSinkDoesNotChangeOutcome)
{
  Invoker invoker{bind("sum", &TestService::sum), telemetry};

  EXPECT_CALL(*telemetry, invoked).WillOnce([](std::string_view, std::string_view) {
    throw std::runtime_error{"collector offline"};
  });
  EXPECT_CALL(*telemetry, completed)
      .WillOnce([](std::string_view, std::string_view, duration_t) {
        throw std::runtime_error{"collector offline"};
      });

  auto outcome = invoker.invoke(service, make_inputs({1, 2})).get();
  ASSERT_TRUE(outcome.succeeded());
  EXPECT_EQ(std::any_cast<int>(outcome.value().value()), 3);
}

TEST_F(InvokerTelemetry, SinkThrowingNonStandardValues)
{
  Invoker invoker{bind("sum", &TestService::sum), telemetry};

  EXPECT_CALL(*telemetry, invoked).WillOnce([](std::string_view, std::string_view) {
    throw 42;
  });

  Pending<InvocationOutcome> pending;
  EXPECT_NO_THROW(pending = invoker.invoke(service, make_inputs({1, 2})));
  ASSERT_TRUE(pending.is_settled());
  EXPECT_TRUE(pending.get().succeeded());
}

TEST_F(InvokerTelemetry, SinkThrowingAfterSuspension)
{
  Invoker invoker{bind("deferred", &TestService::deferred), telemetry};

  EXPECT_CALL(*telemetry, completed)
      .WillOnce([](std::string_view, std::string_view, duration_t) { throw 42; });

  auto pending = invoker.invoke(service, make_inputs({1, 2}));
  EXPECT_NO_THROW(service->pending_value.set_value(5));

  ASSERT_TRUE(pending.is_settled());
  EXPECT_EQ(std::any_cast<int>(pending.get().value().value()), 5);
}

TEST_F(InvokerTelemetry, SinkFailingToReportState)
{
  Invoker invoker{bind("sum", &TestService::sum), telemetry};

  EXPECT_CALL(*telemetry, enabled()).WillRepeatedly([]() -> bool {
    throw std::runtime_error{"collector offline"};
  });
  EXPECT_CALL(*telemetry, invoked).Times(0);
  EXPECT_CALL(*telemetry, completed).Times(0);

  Pending<InvocationOutcome> pending;
  EXPECT_NO_THROW(pending = invoker.invoke(service, make_inputs({1, 2})));
  EXPECT_TRUE(pending.get().succeeded());
}

TEST_F(InvokerTelemetry, NoEventsBeforeDispatch)
{
  Invoker invoker{bind("sum", &TestService::sum), telemetry};

  EXPECT_CALL(*telemetry, invoked).Times(0);
  EXPECT_CALL(*telemetry, failed).Times(0);

  EXPECT_EQ(invoker.invoke(service, make_inputs({1})).get().status(), Status::FAILED);
  EXPECT_EQ(invoker.invoke(nullptr, make_inputs({1, 2})).get().status(), Status::FAILED);
}

TEST(LoggingTelemetry, WritesEvents)
{
  std::ostringstream stream;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
  auto logger = std::make_shared<spdlog::logger>("telemetry-test", sink);
  logger->set_pattern("%l %v");
  logger->set_level(spdlog::level::info);

  LoggingTelemetry telemetry{logger};
  EXPECT_TRUE(telemetry.enabled());

  telemetry.invoked("sum", "c1");
  telemetry.faulted("sum", "c1", duration_t{15});
  logger->flush();

  std::string output = stream.str();
  EXPECT_NE(output.find("info Operation sum invoked, correlation c1"), std::string::npos);
  EXPECT_NE(
      output.find("warning Operation sum faulted after 15 us, correlation c1"), std::string::npos
  );

  logger->set_level(spdlog::level::warn);
  EXPECT_FALSE(telemetry.enabled());
}
