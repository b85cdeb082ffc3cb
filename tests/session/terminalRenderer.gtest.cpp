#include "core/errors.hpp"
#include "fakes.hpp"
#include "session/terminalRenderer.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace lookahead::gtest {

using session::TerminalRenderer;

TEST(TerminalRenderer, SplitLines) {
	EXPECT_EQ(session::lineCount(""), 0u);
	EXPECT_EQ(session::lineCount("a"), 1u);
	EXPECT_EQ(session::lineCount("a\nb\n"), 2u);
	EXPECT_EQ(session::lineCount("a\n\nb"), 3u);

	const auto lines = session::splitLines("one\r\ntwo\n");
	ASSERT_EQ(lines.size(), 2u);
	EXPECT_EQ(lines[0], "one");
	EXPECT_EQ(lines[1], "two");
}

TEST(TerminalRenderer, ClearingZeroLinesWritesNothing) {
	std::ostringstream out;
	TerminalRenderer renderer(out);
	VirtualScreen screen(out);

	renderer.writeLine(3u, "keep me");
	const auto before = screen.bytesWritten();

	renderer.clearLines(3u, 0u);
	EXPECT_EQ(screen.bytesWritten(), before);
	EXPECT_EQ(screen.row(3u), "keep me");
}

TEST(TerminalRenderer, ClearLinesIsIdempotent) {
	std::ostringstream out;
	TerminalRenderer renderer(out);
	VirtualScreen screen(out);

	renderer.renderBlock(2u, "a\nb\nc\n");
	renderer.clearLines(2u, 2u);
	renderer.clearLines(2u, 2u);

	EXPECT_EQ(screen.row(2u), "");
	EXPECT_EQ(screen.row(3u), "");
	EXPECT_EQ(screen.row(4u), "c");
}

TEST(TerminalRenderer, RepeatedRepaintGivesSameScreen) {
	std::ostringstream out;
	TerminalRenderer renderer(out);
	VirtualScreen screen(out);

	renderer.writeLine(1u, "? 1");
	renderer.repaint(2u, 0u, " X | - \n---|---\n");
	const auto first  = screen.row(2u);
	const auto second = screen.row(3u);

	renderer.repaint(2u, 2u, " X | - \n---|---\n");
	EXPECT_EQ(screen.row(2u), first);
	EXPECT_EQ(screen.row(3u), second);
	EXPECT_EQ(screen.row(4u), "");
	EXPECT_EQ(screen.row(1u), "? 1");
}

TEST(TerminalRenderer, RepaintClearsPreviousExtent) {
	std::ostringstream out;
	TerminalRenderer renderer(out);
	VirtualScreen screen(out);

	renderer.repaint(5u, 0u, "1\n2\n3\n");
	renderer.repaint(5u, 3u, "only\n");

	EXPECT_EQ(screen.row(5u), "only");
	EXPECT_EQ(screen.row(6u), "");
	EXPECT_EQ(screen.row(7u), "");
}

TEST(TerminalRenderer, RepaintRestoresCursor) {
	std::ostringstream out;
	TerminalRenderer renderer(out);
	VirtualScreen screen(out);

	renderer.writeLine(7u, "? 12");
	renderer.repaint(8u, 0u, "preview\n");

	EXPECT_EQ(screen.row(8u), "preview");
	EXPECT_EQ(screen.cursorLine(), 7u);
	EXPECT_EQ(screen.cursorColumn(), 5u);
}

TEST(TerminalRenderer, ClearScreen) {
	std::ostringstream out;
	TerminalRenderer renderer(out);
	VirtualScreen screen(out);

	renderer.renderBlock(1u, "a\nb\n");
	renderer.clearScreen();

	EXPECT_EQ(screen.row(1u), "");
	EXPECT_EQ(screen.row(2u), "");
	EXPECT_EQ(screen.cursorLine(), 1u);
}

TEST(TerminalRenderer, FailingStreamThrows) {
	std::ostringstream out;
	TerminalRenderer renderer(out);

	out.setstate(std::ios::badbit);
	EXPECT_THROW(renderer.writeLine(1u, "lost"), TerminalError);
}

} // namespace lookahead::gtest
