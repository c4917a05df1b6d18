#include "sandbox/environment.hpp"
#include <boost/assign/list_of.hpp>

namespace sandbox {
using namespace std;

// clang-format off
static const vector<string> allow_list = boost::assign::list_of
    // 纯计算
    ("abs")("pow")("round")
    // 类型构造
    ("bool")("int")("float")("str")("list")("dict")("set")("tuple")
    // 迭代与检查
    ("len")("range")("enumerate")("zip")("map")("filter")("sorted")("reversed")
    ("min")("max")("sum")("all")("any")("isinstance")("type")
    // 字符与格式化
    ("bin")("hex")("chr")("ord")("format")
    // 唯一允许的输出
    ("print");
// clang-format on

const vector<string> &allowed_builtins() {
    return allow_list;
}

}  // namespace sandbox
