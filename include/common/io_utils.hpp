#pragma once

#include <filesystem>
#include <string>

namespace gradeguard {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

}  // namespace gradeguard
