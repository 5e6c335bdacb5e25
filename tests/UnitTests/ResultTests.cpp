#include <catch2/catch.hpp>
#include <Trove/Core/Error.hpp>
#include <Trove/Core/Result.hpp>
#include <memory>
#include <string>

using namespace Trove;

namespace
{
    Result<int, Error> Parse(const std::string& text)
    {
        if (text.empty())
        {
            return Err(ErrorCode::InvalidArgument, "empty input");
        }
        return static_cast<int>(text.size());
    }

    Result<void, Error> Check(bool ok)
    {
        if (!ok)
        {
            return Err(ErrorCode::CapacityOverflow);
        }
        return OK;
    }
}

TEST_CASE("Result holding a value", "[Result]")
{
    auto result = Parse("abc");
    REQUIRE(result.IsOk());
    REQUIRE_FALSE(result.IsErr());
    REQUIRE(static_cast<bool>(result));
    REQUIRE(result.Value() == 3);
    REQUIRE(*result == 3);
    REQUIRE(result.ValueOr(-1) == 3);
}

TEST_CASE("Result holding an error", "[Result]")
{
    auto result = Parse("");
    REQUIRE(result.IsErr());
    REQUIRE(result.Error().code == ErrorCode::InvalidArgument);
    REQUIRE(std::string(result.Error().message) == "empty input");
    REQUIRE(result.ValueOr(-1) == -1);
    REQUIRE(result == Err(ErrorCode::InvalidArgument));
    REQUIRE(result != Err(ErrorCode::AllocationFailed));
}

TEST_CASE("Error default messages", "[Result]")
{
    REQUIRE(std::string(Error(ErrorCode::AllocationFailed).message) == "Allocation failed");
    REQUIRE(std::string(Error(ErrorCode::CapacityOverflow).message) == "Capacity overflow");
    REQUIRE(MakeError(ErrorCode::None).code == ErrorCode::None);
}

TEST_CASE("Result<void>", "[Result]")
{
    REQUIRE(Check(true).IsOk());
    REQUIRE(Ok().IsOk());

    auto failed = Check(false);
    REQUIRE(failed.IsErr());
    REQUIRE(failed.Error().code == ErrorCode::CapacityOverflow);
    REQUIRE(std::string(failed.Error().message) == "Capacity overflow");
}

TEST_CASE("Result with move-only values", "[Result]")
{
    Result<std::unique_ptr<int>, Error> result(std::make_unique<int>(7));
    REQUIRE(result.IsOk());

    Result<std::unique_ptr<int>, Error> moved(std::move(result));
    REQUIRE(*moved.Value() == 7);

    std::unique_ptr<int> owned = std::move(moved).Value();
    REQUIRE(*owned == 7);

    Result<std::unique_ptr<int>, Error> assigned = Err(ErrorCode::Unknown);
    assigned = Result<std::unique_ptr<int>, Error>(std::make_unique<int>(9));
    REQUIRE(assigned.IsOk());
    REQUIRE(*assigned.Value() == 9);
}
