#include <doctest/doctest.h>
#include "dgtlink/board_state.hpp"
#include "dgtlink/status.hpp"

#include <string>
#include <vector>

using namespace dgtlink;

static const char* START = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR";

TEST_CASE("New board is empty and prints as eight empty ranks") {
    BoardState b;
    CHECK(b.empty());
    CHECK(std::string(b.fen().c_str()) == "8/8/8/8/8/8/8/8");
}

TEST_CASE("Placement text survives decode/encode/decode") {
    const std::vector<std::string> positions = {
        START,
        "8/8/8/8/8/8/8/8",
        "r1bqkb1r/pppp1ppp/2n2n2/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R",
        "4k3/8/8/8/8/8/8/4K2R",
        "7q/6P1/5p2/4N3/3b4/2R5/1n6/Q7",
    };
    for (const auto& s : positions) {
        CAPTURE(s);
        BoardState once(s);
        BoardState twice(std::string(once.fen().c_str()));
        CHECK(once == twice);
        CHECK(std::string(once.fen().c_str()) == s);
    }
}

TEST_CASE("Square order starts at the far rank") {
    BoardState b(START);
    CHECK(b.at(0) == BoardState::piece_code('r'));
    CHECK(b.at(4) == BoardState::piece_code('k'));
    CHECK(b.at(8) == BoardState::piece_code('p'));
    CHECK(b.at(60) == BoardState::piece_code('K'));
    CHECK(b.at(63) == BoardState::piece_code('R'));
    CHECK(b.at(32) == BoardState::EMPTY);
}

TEST_CASE("Clearing a board gives the empty placement") {
    BoardState b(START);
    b.clear();
    CHECK(b.empty());
    CHECK(std::string(b.fen().c_str()) == "8/8/8/8/8/8/8/8");
}

TEST_CASE("Malformed placement text is rejected and leaves the board unchanged") {
    BoardState b(START);
    const BoardState before = b;
    std::string err;

    SUBCASE("wrong rank count") {
        CHECK_FALSE(b.try_set_fen("8/8/8/8/8/8/8", err));
        CHECK(err.find("expected 8 rows") != std::string::npos);
        CHECK_FALSE(b.try_set_fen("8/8/8/8/8/8/8/8/8", err));
    }
    SUBCASE("two digits in a row") {
        CHECK_FALSE(b.try_set_fen("8/8/44/8/8/8/8/8", err));
        CHECK(err.find("two subsequent digits in row 3") != std::string::npos);
    }
    SUBCASE("rank too short or too long") {
        CHECK_FALSE(b.try_set_fen("8/8/8/7/8/8/8/8", err));
        CHECK(err.find("expected 8 columns in row 4") != std::string::npos);
        CHECK_FALSE(b.try_set_fen("8/8/8/8/8/8/8/ppppppppp", err));
        CHECK(err.find("row 8") != std::string::npos);
    }
    SUBCASE("unknown letter") {
        CHECK_FALSE(b.try_set_fen("8/8/8/8/3X4/8/8/8", err));
        CHECK(err.find("invalid character 'X' in row 5") != std::string::npos);
    }
    CHECK(b == before);
}

TEST_CASE("set_fen throws ConfigurationError naming the input") {
    BoardState b;
    try {
        b.set_fen("9/8/8/8/8/8/8/8");
        FAIL("expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        CHECK(std::string(e.what()).find("9/8/8/8/8/8/8/8") != std::string::npos);
    }
    CHECK_THROWS_AS(BoardState("not a position"), ConfigurationError);
}

TEST_CASE("Raw square codes: full dump and single updates are validated") {
    BoardState b;
    std::string err;

    uint8_t codes[64] = {};
    codes[0]  = 0x08;   // r
    codes[63] = 0x02;   // R
    REQUIRE(b.set_squares(codes, 64, err));
    CHECK(std::string(b.fen().c_str()) == "r7/8/8/8/8/8/8/7R");

    codes[10] = 0x0D;
    CHECK_FALSE(b.set_squares(codes, 64, err));
    CHECK(err.find("unknown piece code 13") != std::string::npos);
    CHECK_FALSE(b.set_squares(codes, 10, err));
    CHECK(std::string(b.fen().c_str()) == "r7/8/8/8/8/8/8/7R");

    CHECK(b.set_square(36, BoardState::piece_code('P'), err));
    CHECK(b.at(36) == 0x01);
    CHECK_FALSE(b.set_square(64, 0x01, err));
    CHECK_FALSE(b.set_square(5, 0x20, err));
}

TEST_CASE("Grid rendering uses dots for empty squares") {
    BoardState b("8/8/8/8/8/8/8/K7");
    const std::string grid = b.to_string();
    CHECK(grid.substr(0, 15) == ". . . . . . . .");
    CHECK(grid.substr(grid.size() - 15) == "K . . . . . . .");
}
