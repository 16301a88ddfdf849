//
// Created by lewis on 4/3/24.
//

#ifndef BULK_SUBMIT_SERVER_NDJSONLINEBUFFER_H
#define BULK_SUBMIT_SERVER_NDJSONLINEBUFFER_H

#include <functional>
#include <string>
#include <string_view>

// Splits a body that arrives in arbitrary chunks into ndjson lines. Lines may span any number of chunks
class NdjsonLineBuffer {
public:
    using LineHandler = std::function<void(const std::string&)>;

    // Calls onLine for every complete line, blank ones included, without the line ending. Whatever follows the last
    // newline is kept for the next chunk
    void push(std::string_view chunk, const LineHandler& onLine);

    // Calls onLine with the buffered trailing line, if there is one. Called once the body has ended
    void flush(const LineHandler& onLine);

    static auto isBlank(const std::string& line) -> bool;

    [[nodiscard]] auto hasPending() const -> bool { return !pending.empty(); }

private:
    static void emit(std::string line, const LineHandler& onLine);

    std::string pending;
};

#endif //BULK_SUBMIT_SERVER_NDJSONLINEBUFFER_H
