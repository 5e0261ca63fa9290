#include "category.hpp"
#include <algorithm>
#include <cctype>

const std::vector<CategoryInfo>& listCategories() {
    static const std::vector<CategoryInfo> catalogue = {
        {Category::PHONE, "phone", "手机号码",
         "11 digits starting with 1 and 3-9, optional +86 prefix"},
        {Category::LANDLINE, "landline", "座机号码",
         "optional area code followed by a 7-8 digit number"},
        {Category::ID_CARD, "id_card", "身份证号",
         "17 digits and a GB 11643 check character"},
        {Category::ADDRESS, "address", "家庭住址",
         "text anchored on province/city/district/road/number markers"},
        {Category::EMAIL, "email", "电子邮箱",
         "local-part@domain with at least one dot in the domain"},
        {Category::PASSWORD, "password", "密码",
         "password label followed by a 6+ character token"},
        {Category::CREDIT_CARD, "credit_card", "银行卡号",
         "16-19 digits, optionally in groups of 4, Luhn checked"},
        {Category::IP_ADDRESS, "ip_address", "IP地址",
         "dotted IPv4 address"},
    };
    return catalogue;
}

std::set<Category> allCategories() {
    std::set<Category> result;
    for (const auto& info : listCategories())
        result.insert(info.category);
    return result;
}

std::string categoryTag(Category category) {
    for (const auto& info : listCategories()) {
        if (info.category == category)
            return info.tag;
    }
    throw UnknownCategory(std::to_string(static_cast<int>(category)));
}

Category categoryFromTag(const std::string& tag) {
    std::string lowered = tag;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& info : listCategories()) {
        if (info.tag == lowered)
            return info.category;
    }
    throw UnknownCategory(tag);
}

std::set<Category> parseCategories(const std::vector<std::string>& tags) {
    std::set<Category> result;
    for (const auto& tag : tags) {
        std::string lowered = tag;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == CATEGORY_ALL_TAG) {
            auto all = allCategories();
            result.insert(all.begin(), all.end());
            continue;
        }
        result.insert(categoryFromTag(tag));
    }
    return result;
}
