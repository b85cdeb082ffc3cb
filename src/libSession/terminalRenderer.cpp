#include "session/terminalRenderer.hpp"

#include "core/errors.hpp"

#include <format>

namespace lookahead::session {

static constexpr std::string_view CLEAR_LINE     = "\x1b[2K";
static constexpr std::string_view CLEAR_SCREEN   = "\x1b[2J";
static constexpr std::string_view SAVE_CURSOR    = "\x1b" "7";
static constexpr std::string_view RESTORE_CURSOR = "\x1b" "8";

static std::string cursorTo(Line line, unsigned column) {
	return std::format("\x1b[{};{}H", line, column);
}

std::vector<std::string_view> splitLines(std::string_view text) {
	std::vector<std::string_view> lines;
	while (!text.empty()) {
		const auto end = text.find('\n');
		auto line      = text.substr(0, end);
		if (line.ends_with('\r')) {
			line.remove_suffix(1);
		}
		lines.push_back(line);
		if (end == std::string_view::npos) {
			break;
		}
		text.remove_prefix(end + 1);
	}
	return lines;
}

std::size_t lineCount(std::string_view text) {
	return splitLines(text).size();
}

TerminalRenderer::TerminalRenderer(std::ostream& out) : m_out{out} {
}

void TerminalRenderer::clearScreen() {
	m_out << CLEAR_SCREEN << cursorTo(1u, 1u);
	flush();
}

void TerminalRenderer::moveTo(Line line, unsigned column) {
	m_out << cursorTo(line, column);
	flush();
}

void TerminalRenderer::clearLines(Line start, std::size_t count) {
	if (count == 0u) {
		return;
	}
	emitClearLines(start, count);
	flush();
}

void TerminalRenderer::writeLine(Line line, std::string_view text) {
	m_out << cursorTo(line, 1u) << CLEAR_LINE << text;
	flush();
}

void TerminalRenderer::renderBlock(Line start, std::string_view text) {
	emitBlock(start, text);
	flush();
}

void TerminalRenderer::repaint(Line start, std::size_t previousLineCount, std::string_view text) {
	m_out << SAVE_CURSOR;
	emitClearLines(start, previousLineCount);
	emitBlock(start, text);
	m_out << RESTORE_CURSOR;
	flush();
}

void TerminalRenderer::emitClearLines(Line start, std::size_t count) {
	for (std::size_t i = 0; i != count; ++i) {
		m_out << cursorTo(start + static_cast<Line>(i), 1u) << CLEAR_LINE;
	}
}

void TerminalRenderer::emitBlock(Line start, std::string_view text) {
	Line line = start;
	for (const auto content: splitLines(text)) {
		m_out << cursorTo(line++, 1u) << CLEAR_LINE << content;
	}
}

void TerminalRenderer::flush() {
	m_out.flush();
	if (!m_out) {
		throw TerminalError("Writing to the terminal failed.");
	}
}

} // namespace lookahead::session
