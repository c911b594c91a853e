#include <dispatch/common/exceptions.hpp>
#include <dispatch/common/util.hpp>

#include <stdexcept>
#include <string>
#include <variant>

#include <gtest/gtest.h>

using namespace dispatch::common;

TEST(CommonUtil, DescribeNestedCauses)
{
  std::exception_ptr error;
  try {
    try {
      throw std::runtime_error{"disk full"};
    } catch (...) {
      std::throw_with_nested(InvocationFailure{"store", "Invocation of operation store failed"});
    }
  } catch (...) {
    error = std::current_exception();
  }

  EXPECT_EQ(util::describe(error), "Invocation of operation store failed: disk full");
  EXPECT_EQ(util::describe(std::make_exception_ptr(InvalidState{"closed"})), "closed");
  EXPECT_EQ(util::describe(nullptr), "");
}

TEST(CommonUtil, DescribeNonStandardExceptions)
{
  EXPECT_EQ(util::describe(std::make_exception_ptr(7)), "unknown exception");

  std::exception_ptr error;
  try {
    try {
      throw 7;
    } catch (...) {
      std::throw_with_nested(InvalidState{"cleanup failed"});
    }
  } catch (...) {
    error = std::current_exception();
  }

  std::string message;
  EXPECT_NO_THROW(message = util::describe(error));
  EXPECT_EQ(message, "cleanup failed: unknown exception");
}

TEST(CommonUtil, BusinessFault)
{
  BusinessFault fault{"OutOfStock", "Item 3 is not available"};

  EXPECT_EQ(fault.code(), "OutOfStock");
  EXPECT_EQ(fault.reason(), "Item 3 is not available");
}

TEST(CommonUtil, NamedLogger)
{
  auto logger = util::create_logger("Test");

  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "Test");
  EXPECT_EQ(logger->level(), spdlog::get_level());
}

TEST(CommonUtil, OverloadedVisitor)
{
  std::variant<int, std::string> value{std::string{"text"}};

  auto kind = std::visit(
      util::overloaded{
          [](int) { return std::string{"int"}; },
          [](const std::string&) { return std::string{"string"}; }},
      value
  );

  EXPECT_EQ(kind, "string");
}
