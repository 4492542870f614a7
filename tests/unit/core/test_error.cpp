//
// Created by gregorian-rayne on 2/18/26.
//

#include "kda/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace kda
{
    TEST(ErrorTest, BasicConstruction) {
        const Error error(ErrorCode::InvalidArgument, "invalid value");

        EXPECT_EQ(error.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(error.message(), "invalid value");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ConstructionWithContext) {
        const Error error(ErrorCode::NotFound, "component not found", "sched");

        EXPECT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "sched");
    }

    TEST(ErrorTest, FactoryWithoutContextHasNoContext) {
        const auto error = Error::io_error("write failed");

        EXPECT_EQ(error.code(), ErrorCode::IoError);
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, FactoryCodes) {
        EXPECT_EQ(Error::parse_error("x").code(), ErrorCode::ParseError);
        EXPECT_EQ(Error::config_error("x").code(), ErrorCode::ConfigError);
        EXPECT_EQ(Error::duplicate_component("x").code(), ErrorCode::DuplicateComponent);
        EXPECT_EQ(Error::analysis_error("x").code(), ErrorCode::AnalysisError);
        EXPECT_EQ(Error::internal_error("x").code(), ErrorCode::InternalError);
        EXPECT_EQ(Error::not_found("x").code(), ErrorCode::NotFound);
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto error = Error::parse_error("bad entry", "components[2]").with_context("kernel.json");

        EXPECT_EQ(error.context().value(), "components[2]; kernel.json");
        EXPECT_EQ(error.message(), "bad entry");
    }

    TEST(ErrorTest, WithContextOnEmpty) {
        const auto error = Error::io_error("disk full").with_context("report.txt");
        EXPECT_EQ(error.context().value(), "report.txt");
    }

    TEST(ErrorTest, ToString) {
        const auto plain = Error::duplicate_component("declared twice");
        EXPECT_EQ(plain.to_string(), "[DuplicateComponent] declared twice");

        const auto with_ctx = Error::io_error("cannot open", "out.dot");
        EXPECT_EQ(with_ctx.to_string(), "[IoError] cannot open (context: out.dot)");
    }

    TEST(ErrorTest, Equality) {
        EXPECT_EQ(Error::io_error("a", "b"), Error::io_error("a", "b"));
        EXPECT_NE(Error::io_error("a", "b"), Error::io_error("a"));
        EXPECT_NE(Error::io_error("a"), Error::parse_error("a"));
    }

    TEST(ErrorTest, StreamOutput) {
        std::ostringstream ss;
        ss << Error::not_found("missing", "mm") << " " << ErrorCode::ConfigError;

        EXPECT_EQ(ss.str(), "[NotFound] missing (context: mm) ConfigError");
    }

}  // namespace kda
