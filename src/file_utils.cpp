#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

// Сравнение расширений без учёта регистра
bool hasExtension(const std::filesystem::path& path, const std::string& ext) {
    const std::string pathExt = path.extension().string();
    if (pathExt.size() != ext.size()) {
        return false;
    }
    return std::equal(pathExt.begin(), pathExt.end(), ext.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

// Файл читается блоками по 1 МБ, считаются символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    constexpr std::size_t bufferSize = 1024 * 1024;
    std::vector<char> buffer(bufferSize);

    std::size_t lineCount = 0;
    char lastChar = '\n';
    while (input.read(buffer.data(), static_cast<std::streamsize>(bufferSize)) || input.gcount() > 0) {
        const auto bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += static_cast<std::size_t>(std::count(buffer.begin(), buffer.begin() + bytesRead, '\n'));
        lastChar = buffer[bytesRead - 1];
    }

    // Последняя строка без завершающего \n
    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::filesystem::path findProjectRoot() {
    std::error_code error;
    std::filesystem::path current = std::filesystem::current_path(error);
    if (error) {
        return {};
    }
    const std::filesystem::path start = current;

    // Поднимаемся вверх по директориям, пока не найдем папку tests или CMakeLists.txt
    while (!current.empty()) {
        if (std::filesystem::is_directory(current / "tests", error) ||
            std::filesystem::is_regular_file(current / "CMakeLists.txt", error)) {
            return current;
        }

        std::filesystem::path parent = current.parent_path();
        if (parent == current) {
            break; // Корень файловой системы
        }
        current = parent;
    }
    return start;
}

std::vector<std::filesystem::path> findFilesWithExtension(const std::filesystem::path& directory,
                                                          const std::string& ext) {
    std::vector<std::filesystem::path> files;

    std::error_code error;
    std::filesystem::directory_iterator it(directory, error);
    if (error) {
        // Директории нет или она недоступна
        return files;
    }

    for (const auto& entry : it) {
        if (entry.is_regular_file(error) && hasExtension(entry.path(), ext)) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}
