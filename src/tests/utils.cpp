#include "utils.h"

#include <thread>

std::shared_ptr<std::default_random_engine> rng =
    nullptr;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

auto randomInt(uint64_t start, uint64_t end) -> uint64_t
{
    if (!rng)
    {
        rng = std::make_shared<std::default_random_engine>(std::chrono::system_clock::now().time_since_epoch().count());
    }

    std::uniform_int_distribution<uint64_t> rng_dist(start, end);
    return rng_dist(*rng);
}

auto readFile(const std::filesystem::path& path) -> std::string
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    std::stringstream content;
    content << file.rdbuf();
    return content.str();
}

auto readLines(const std::filesystem::path& path) -> std::vector<std::string>
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line))
    {
        if (!line.empty())
        {
            lines.push_back(line);
        }
    }

    return lines;
}

auto waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout) -> bool
{
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!condition())
    {
        if (std::chrono::steady_clock::now() > deadline)
        {
            return false;
        }

        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    return true;
}
