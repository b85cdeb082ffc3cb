#pragma once

#include <cstddef>
#include <ostream>
#include <string_view>
#include <vector>

namespace lookahead::session {

using Line = unsigned; //!< Terminal row, starting at 1.

//! Splits text into lines. A trailing newline does not start another line; trailing '\r' is dropped.
std::vector<std::string_view> splitLines(std::string_view text);
//! Number of lines splitLines returns.
std::size_t lineCount(std::string_view text);

//! Draws line-oriented regions with cursor addressing instead of full-screen redraws.
//! Every call flushes; a failing stream raises TerminalError.
class TerminalRenderer {
public:
	explicit TerminalRenderer(std::ostream& out);

	void clearScreen();
	void moveTo(Line line, unsigned column = 1u);

	//! Clear count lines starting at start. Clearing zero lines writes nothing.
	void clearLines(Line start, std::size_t count);
	//! Replace the content of one line. The cursor stays behind the text.
	void writeLine(Line line, std::string_view text);
	//! Write text line by line starting at start, clearing each line first.
	void renderBlock(Line start, std::string_view text);
	//! Clear the previous extent of a region and draw text into it.
	//! The cursor is put back where it was before the call.
	void repaint(Line start, std::size_t previousLineCount, std::string_view text);

private:
	void emitClearLines(Line start, std::size_t count);
	void emitBlock(Line start, std::string_view text);
	void flush();

private:
	std::ostream& m_out;
};

} // namespace lookahead::session
