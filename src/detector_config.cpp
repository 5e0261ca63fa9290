#include "detector_config.hpp"

std::map<Category, std::vector<std::string>> DetectorConfig::defaultLabels() {
    return {
        {Category::PHONE, {"tel", "phone", "mobile", "手机", "电话", "联系", "拨打", "号码"}},
        {Category::LANDLINE, {"tel", "phone", "fax", "电话", "座机", "分机", "传真", "客服"}},
        {Category::EMAIL, {"email", "e-mail", "mail", "邮箱", "邮件", "电子邮件"}},
        {Category::IP_ADDRESS, {"ip", "host", "server", "地址", "服务器", "网络", "主机"}},
    };
}

const std::vector<std::string>& DetectorConfig::labelsFor(Category category) const {
    static const std::vector<std::string> none;
    auto it = labels.find(category);
    return it != labels.end() ? it->second : none;
}
