// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <token/canonical.h>

#include <hash.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

static bool IsIntegerLiteral(const std::string& literal)
{
    size_t pos = (!literal.empty() && literal[0] == '-') ? 1 : 0;
    if (pos == literal.size())
        return false;
    for (; pos < literal.size(); ++pos) {
        if (literal[pos] < '0' || literal[pos] > '9')
            return false;
    }
    return true;
}

static bool ParseDoubleClassic(const std::string& str, double& out)
{
    std::istringstream text(str);
    text.imbue(std::locale::classic());
    text >> out;
    return !text.fail() && text.eof();
}

std::string CanonicalNumber(const std::string& literal)
{
    if (IsIntegerLiteral(literal)) {
        const bool negative = literal[0] == '-';
        size_t first = negative ? 1 : 0;
        while (first + 1 < literal.size() && literal[first] == '0')
            ++first;
        std::string digits = literal.substr(first);
        if (digits == "0")
            return digits;
        return negative ? "-" + digits : digits;
    }

    double value;
    if (!ParseDoubleClassic(literal, value))
        throw std::runtime_error(strprintf("invalid JSON number %s", literal));

    // shortest precision that reads back as the same double
    std::string result;
    for (int precision = 15; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream text;
        text.imbue(std::locale::classic());
        text.precision(precision);
        text << value;
        result = text.str();
        double check;
        if (ParseDoubleClassic(result, check) && check == value)
            break;
    }
    if (result == "-0")
        return "0";
    return result;
}

UniValue CanonicalizeJSON(const UniValue& value)
{
    switch (value.getType()) {
    case UniValue::VOBJ: {
        const std::vector<std::string>& keys = value.getKeys();
        const std::vector<UniValue>& values = value.getValues();
        std::vector<std::pair<std::string, size_t>> order;
        order.reserve(keys.size());
        for (size_t i = 0; i < keys.size(); ++i)
            order.emplace_back(keys[i], i);
        std::sort(order.begin(), order.end());

        UniValue result(UniValue::VOBJ);
        for (size_t i = 0; i < order.size(); ++i) {
            if (i > 0 && order[i].first == order[i - 1].first)
                throw std::runtime_error(strprintf("duplicate key \"%s\" in JSON object", order[i].first));
            result.pushKV(order[i].first, CanonicalizeJSON(values[order[i].second]));
        }
        return result;
    }
    case UniValue::VARR: {
        UniValue result(UniValue::VARR);
        for (const UniValue& item : value.getValues())
            result.push_back(CanonicalizeJSON(item));
        return result;
    }
    case UniValue::VNUM:
        return UniValue(UniValue::VNUM, CanonicalNumber(value.getValStr()));
    default:
        return value;
    }
}

std::string WriteCanonicalJSON(const UniValue& value)
{
    return CanonicalizeJSON(value).write();
}

uint256 CanonicalDigest(const UniValue& value)
{
    const std::string canonical = WriteCanonicalJSON(value);
    return SingleHash(canonical.begin(), canonical.end());
}
