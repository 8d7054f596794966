// ============================================================
// test_tui.cpp -- Progress line rendering
// ============================================================

#include "common/tui.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>

static TuiState half_done() {
    TuiState st;
    st.bytes_total  = 1000;
    st.bytes_sent   = 500;
    st.chunks_total = 2;
    st.chunks_sent  = 1;
    st.label        = "boot.dol";
    return st;
}

TEST(Tui, AnsiFrameRedrawsInPlace) {
    TuiState st = half_done();
    std::ostringstream out;
    Tui tui(st, out, true);
    tui.render();
    std::string s = out.str();
    EXPECT_EQ(0u, s.find("\r\x1b[2K"));
    EXPECT_NE(std::string::npos, s.find("Chunks: 1/2"));
    EXPECT_NE(std::string::npos, s.find("boot.dol"));
    EXPECT_EQ(std::string::npos, s.find('\n'));
}

TEST(Tui, FinishEndsTheLineOnce) {
    TuiState st = half_done();
    std::ostringstream out;
    {
        Tui tui(st, out, true);
        tui.render();
        tui.finish();
        tui.finish();
    }
    std::string s = out.str();
    EXPECT_EQ(1, std::count(s.begin(), s.end(), '\n'));
    EXPECT_EQ('\n', s.back());
}

TEST(Tui, AbandonedAnsiFrameStillEndsItsLine) {
    TuiState st = half_done();
    std::ostringstream out;
    {
        Tui tui(st, out, true);
        tui.render();
    }
    std::string s = out.str();
    ASSERT_FALSE(s.empty());
    EXPECT_EQ('\n', s.back());
    EXPECT_EQ(1, std::count(s.begin(), s.end(), '\n'));
}

TEST(Tui, NothingDrawnMeansNothingWritten) {
    TuiState st = half_done();
    std::ostringstream out;
    { Tui tui(st, out, true); }
    EXPECT_TRUE(out.str().empty());
}

TEST(Tui, PlainModePrintsOneLinePerUpdate) {
    TuiState st = half_done();
    std::ostringstream out;
    {
        Tui tui(st, out, false);
        tui.render();
        st.chunks_sent = 2;
        st.bytes_sent  = 1000;
        tui.render();
    }
    std::string s = out.str();
    EXPECT_EQ(2, std::count(s.begin(), s.end(), '\n'));
    EXPECT_EQ(std::string::npos, s.find('\x1b'));
    EXPECT_NE(std::string::npos, s.find("Chunks: 2/2"));
}
