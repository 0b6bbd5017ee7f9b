#include "common/io_utils.hpp"
#include <fstream>
#include "common/exceptions.hpp"

namespace judgecore {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw artifact_error("unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const filesystem::path &path, const string &content) {
    if (path.has_parent_path())
        filesystem::create_directories(path.parent_path());
    filesystem::path tmp = path;
    tmp += ".tmp";
    {
        ofstream fout(tmp, ios::binary | ios::trunc);
        if (!fout) throw artifact_error("unable to write file " + tmp.string());
        fout << content;
    }
    filesystem::rename(tmp, path);
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.front() == '/' || subpath.find("..") != string::npos)
        throw artifact_error("subpath is not safe " + subpath);
    return subpath;
}

string limit_message(const string &message, size_t max_length) {
    if (message.size() <= max_length) return message;
    // 避免从 UTF-8 多字节字符中间截断
    size_t end = max_length;
    while (end > 0 && ((unsigned char)message[end] & 0xC0) == 0x80) --end;
    return message.substr(0, end) + "...";
}

}  // namespace judgecore
