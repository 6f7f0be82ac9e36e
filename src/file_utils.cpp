#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace calc {

namespace {
bool isTxtFile(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext == ".txt";
}

bool looksLikeRoot(const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_directory(dir / kSessionsDirName, ec)
        || std::filesystem::is_regular_file(dir / "CMakeLists.txt", ec);
}
}

// Файл читается блоками по 1 МБ
std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    std::vector<char> block(1024 * 1024);
    std::size_t lineCount = 0;
    char lastChar = '\n';

    while (input.read(block.data(), static_cast<std::streamsize>(block.size())) || input.gcount() > 0) {
        auto bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += static_cast<std::size_t>(std::count(block.begin(), block.begin() + bytesRead, '\n'));
        lastChar = block[bytesRead - 1];
    }

    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::filesystem::path findProjectRoot() {
    std::error_code ec;
    std::filesystem::path start = std::filesystem::current_path(ec);
    if (ec) {
        return ".";
    }

    for (std::filesystem::path dir = start; !dir.empty(); dir = dir.parent_path()) {
        if (looksLikeRoot(dir)) {
            return dir;
        }
        if (dir == dir.root_path()) {
            break;
        }
    }
    return start;
}

// Недоступные элементы директории пропускаются
std::vector<std::filesystem::path> findSessionFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return files;
    }

    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc) && isTxtFile(it->path())) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string getCurrentTimeString() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf{};
#ifdef _WIN32
    localtime_s(&tmBuf, &now);
#else
    localtime_r(&now, &tmBuf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace calc
