//
// Created by lewis on 4/3/24.
//

#include "NdjsonLineBuffer.h"
#include <algorithm>
#include <cctype>
#include <utility>

void NdjsonLineBuffer::push(std::string_view chunk, const LineHandler& onLine) {
    auto start = std::string_view::size_type{0};
    auto newline = chunk.find('\n');

    while (newline != std::string_view::npos) {
        pending.append(chunk.substr(start, newline - start));
        emit(std::move(pending), onLine);
        pending.clear();

        start = newline + 1;
        newline = chunk.find('\n', start);
    }

    pending.append(chunk.substr(start));
}

void NdjsonLineBuffer::flush(const LineHandler& onLine) {
    if (pending.empty()) {
        return;
    }

    emit(std::move(pending), onLine);
    pending.clear();
}

void NdjsonLineBuffer::emit(std::string line, const LineHandler& onLine) {
    // Tolerate CRLF line endings
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    onLine(line);
}

auto NdjsonLineBuffer::isBlank(const std::string& line) -> bool {
    return std::all_of(line.begin(), line.end(), [](unsigned char character) { return std::isspace(character) != 0; });
}
