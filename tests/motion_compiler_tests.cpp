#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "tp/MotionCompiler.h"

#include "foam_test_helpers.h"

#include <string>
#include <vector>

using foam_tests::makePath;
using foam_tests::makeProfile;

TEST_CASE("a thermoplastic path is bracketed and extrudes by distance")
{
    const tp::Program program = tp::compileMotion({makePath({{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}})},
                                                  foam_tests::hotProfile(0.2));

    const std::vector<std::string> lines = tp::toText(program);
    const std::vector<std::string> expected = {
        "; Start path",
        "G1 X0 Y0 Z5 F2000 ; move above start",
        "G1 X0 Y0 Z0 F1500 ; descend to start",
        "G1 X10 Y0 Z0 E2.0000 F1500",
        "; End path",
        "G1 Z5 F2000 ; lift tool",
    };
    CHECK(lines == expected);

    REQUIRE(program[3].field('E').has_value());
    CHECK(*program[3].field('E') == doctest::Approx(2.0));
}

TEST_CASE("extrusion accumulates across points and paths")
{
    const std::vector<tp::Path> paths = {
        makePath({{0.0, 0.0, 0.0}, {3.0, 4.0, 0.0}, {3.0, 4.0, 12.0}}),
        makePath({{0.0, 0.0, 1.0}, {0.0, 10.0, 1.0}}),
    };
    const tp::Program program = tp::compileMotion(paths, foam_tests::hotProfile(0.2));

    std::vector<double> values;
    for (const tp::Instruction& instruction : program)
    {
        if (const auto e = instruction.field('E'))
        {
            values.push_back(*e);
        }
    }

    REQUIRE(values.size() == 3);
    CHECK(values[0] == doctest::Approx(1.0));
    CHECK(values[1] == doctest::Approx(3.4));
    CHECK(values[2] == doctest::Approx(5.4));
    for (std::size_t i = 1; i < values.size(); ++i)
    {
        CHECK(values[i] >= values[i - 1]);
    }
}

TEST_CASE("repeated points do not extrude")
{
    const tp::Program program = tp::compileMotion({makePath({{1.0, 1.0, 1.0}, {1.0, 1.0, 1.0}, {2.0, 1.0, 1.0}})},
                                                  foam_tests::hotProfile(1.0));
    const std::vector<tp::Instruction> moves = foam_tests::vertexMovesOf(program);
    REQUIRE(moves.size() == 3);
    CHECK(*moves[1].field('E') == doctest::Approx(0.0));
    CHECK(tp::toText(moves[1]) == "G1 X1 Y1 Z1 E0.0000 F1500");
    CHECK(*moves[2].field('E') == doctest::Approx(1.0));
}

TEST_CASE("paste and motion-only modes never carry an extrusion field")
{
    const std::vector<tp::Path> paths = {makePath({{0.0, 0.0, 0.0}, {5.0, 0.0, 0.0}, {5.0, 5.0, 0.0}})};

    for (const tp::PrinterProfile& profile : {makeProfile(tp::PasteParams{}), makeProfile(tp::MotionOnlyParams{})})
    {
        const tp::Program program = tp::compileMotion(paths, profile);
        CHECK_FALSE(program.empty());
        for (const tp::Instruction& instruction : program)
        {
            CHECK_FALSE(instruction.hasField('E'));
        }
    }
}

TEST_CASE("each mode uses its own feed and clearance")
{
    const std::vector<tp::Path> paths = {makePath({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}})};

    tp::PasteParams paste;
    paste.clearance_mm = 2.5;
    const std::vector<std::string> pasteLines = tp::toText(tp::compileMotion(paths, makeProfile(paste)));
    CHECK(pasteLines[1] == "G1 X1 Y2 Z5.5 F2000 ; move above start");
    CHECK(pasteLines[2] == "G1 X1 Y2 Z3 F800 ; descend to start");
    CHECK(pasteLines[3] == "G1 X4 Y5 Z6 F800");
    CHECK(pasteLines[5] == "G1 Z8.5 F2000 ; lift tool");

    tp::MotionOnlyParams pen;
    pen.clearance_mm = 7.0;
    pen.penUpHeight_mm = 12.0;
    const std::vector<std::string> penLines = tp::toText(tp::compileMotion(paths, makeProfile(pen)));
    CHECK(penLines[1] == "G1 X1 Y2 Z10 F2000 ; move above start");
    CHECK(penLines[3] == "G1 X4 Y5 Z6 F1000");
    CHECK(penLines[5] == "G1 Z13 F2000 ; lift tool");
}

TEST_CASE("a single-point path descends and lifts")
{
    const std::vector<std::string> lines =
        tp::toText(tp::compileMotion({makePath({{7.5, 8.25, 0.125}})}, makeProfile(tp::MotionOnlyParams{})));
    const std::vector<std::string> expected = {
        "; Start path",
        "G1 X7.5 Y8.25 Z5.125 F2000 ; move above start",
        "G1 X7.5 Y8.25 Z0.125 F1000 ; descend to start",
        "; End path",
        "G1 Z5.125 F2000 ; lift tool",
    };
    CHECK(lines == expected);
}

TEST_CASE("moves follow path order and point order")
{
    const std::vector<tp::Path> paths = {
        makePath({{1.0, 0.0, 0.0}, {2.0, 0.0, 0.0}, {3.0, 0.0, 0.0}}),
        makePath({{4.0, 0.0, 0.0}}),
        makePath({{5.0, 0.0, 0.0}, {6.0, 0.0, 0.0}}),
    };
    const tp::Program program = tp::compileMotion(paths, foam_tests::hotProfile());

    const std::vector<tp::Instruction> moves = foam_tests::vertexMovesOf(program);
    REQUIRE(moves.size() == 6);
    for (std::size_t i = 0; i < moves.size(); ++i)
    {
        CHECK(*moves[i].field('X') == doctest::Approx(static_cast<double>(i + 1)));
    }

    std::size_t starts = 0;
    std::size_t ends = 0;
    for (const tp::Instruction& instruction : program)
    {
        if (instruction.kind == tp::Instruction::Kind::Comment)
        {
            starts += instruction.text == "Start path" ? 1 : 0;
            ends += instruction.text == "End path" ? 1 : 0;
        }
    }
    CHECK(starts == 3);
    CHECK(ends == 3);
}

TEST_CASE("no paths compile to nothing")
{
    CHECK(tp::compileMotion({}, foam_tests::hotProfile()).empty());
}
