#include "common/utils.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <cstdlib>
#include <stdexcept>

namespace arbiter {
using namespace std;
namespace bai = boost::archive::iterators;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

vector<string> to_environ(const map<string, string> &env) {
    vector<string> result;
    for (auto &[key, value] : env)
        result.push_back(key + "=" + value);
    return result;
}

string base64_encode(string_view data) {
    using encoder = bai::base64_from_binary<bai::transform_width<const char *, 6, 8>>;
    string result(encoder(data.data()), encoder(data.data() + data.size()));
    result.append((3 - data.size() % 3) % 3, '=');
    return result;
}

static bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

string base64_decode(string_view text) {
    if (text.size() % 4 != 0)
        throw invalid_argument("base64 length is not a multiple of 4");

    size_t padding = 0;
    while (padding < 2 && padding < text.size() && text[text.size() - 1 - padding] == '=')
        ++padding;

    string buffer(text);
    for (size_t i = 0; i < buffer.size(); ++i) {
        if (i >= buffer.size() - padding) {
            buffer[i] = 'A';  // 填充位按 0 解码，之后截掉
        } else if (!is_base64_char(buffer[i])) {
            throw invalid_argument("invalid base64 character");
        }
    }

    using decoder = bai::transform_width<bai::binary_from_base64<const char *>, 8, 6>;
    string result(decoder(buffer.data()), decoder(buffer.data() + buffer.size()));
    result.resize(result.size() - padding);
    return result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace arbiter
