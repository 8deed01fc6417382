/**
 * @file file_utils.cpp
 * @brief Вспомогательные функции для работы с файлами
 */

#include "file_utils.hpp"
#include "model/errors.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace conic::io {

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw model::IoError("Не удалось открыть файл: " + path.string());
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw model::IoError("Ошибка чтения файла: " + path.string());
    }
    return content;
}

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    const auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw model::IoError("Не удалось создать каталог: " + dir.string());
        }
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw model::IoError("Не удалось открыть временный файл для записи: " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::filesystem::remove(tmp, ec);
            throw model::IoError("Ошибка записи во временный файл: " + tmp.string());
        }
    }

    std::filesystem::remove(path, ec);
    ec.clear();
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw model::IoError("Не удалось атомарно сохранить файл: " + path.string());
    }
}

} // namespace conic::io
