#include "common/io_utils.hpp"
#include <fstream>
#include <iterator>

namespace gradeguard {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

}  // namespace gradeguard
