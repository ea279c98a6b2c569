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
// Сравнение расширения файла без учёта регистра
bool hasExtension(const std::filesystem::path& path, const std::string& ext) {
    std::string pathExt = path.extension().string();
    if (pathExt.empty()) {
        return false;
    }
    return toLowerAscii(pathExt) == toLowerAscii(ext);
}
}

std::string toLowerAscii(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    constexpr std::size_t bufferSize = 1024 * 1024;  // 1 МБ
    std::vector<char> readBuffer(bufferSize);

    std::size_t lineCount = 0;
    char lastChar = '\n';

    while (input.read(readBuffer.data(), bufferSize) || input.gcount() > 0) {
        std::size_t bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += static_cast<std::size_t>(
            std::count(readBuffer.begin(), readBuffer.begin() + bytesRead, '\n'));
        lastChar = readBuffer[bytesRead - 1];
    }

    // Последняя строка без завершающего \n тоже считается
    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::filesystem::path findProjectRoot() {
    try {
        std::filesystem::path current = std::filesystem::current_path();

        // Поднимаемся вверх по директориям, пока не найдем папку tests или CMakeLists.txt
        while (!current.empty()) {
            std::error_code ec;
            if (std::filesystem::is_directory(current / "tests", ec) ||
                std::filesystem::is_regular_file(current / "CMakeLists.txt", ec)) {
                return current;
            }

            std::filesystem::path parent = current.parent_path();
            if (parent == current) {
                // Достигли корня файловой системы
                break;
            }
            current = parent;
        }
    }
    catch (const std::filesystem::filesystem_error&) {
        // Нет доступа к рабочей директории: используем её как есть
    }

    return std::filesystem::current_path();
}

std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> txtFiles;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return txtFiles;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        // Пропускаем файлы, к которым нет доступа или которые были удалены
        if (entry.is_regular_file(ec) && hasExtension(entry.path(), ".txt")) {
            txtFiles.push_back(entry.path());
        }
    }

    std::sort(txtFiles.begin(), txtFiles.end());
    return txtFiles;
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
