#pragma once

#include <filesystem>
#include <string>

namespace judgecore {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 * @throw artifact_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将内容写入文件，会先写入临时文件再重命名，避免读者看到写了一半的文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算文件路径时不会出现目录遍历攻击，如果拿到的文件引用
 * 包含 "../" 或者是绝对路径，那么可能读取到存储目录以外的文件。
 * @param subpath 被检查的文件名
 * @throw artifact_error 若路径不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 截断过长的信息，比如编译错误信息、比较器输出
 * @param message 原始信息
 * @param max_length 最大长度（字节）
 */
std::string limit_message(const std::string &message, std::size_t max_length = 4096);

}  // namespace judgecore
