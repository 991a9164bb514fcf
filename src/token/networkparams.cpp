// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <token/networkparams.h>

#include <utilstrencodings.h>

#include <ctype.h>

static const uint32_t PROD_NETWORK_ID = 15215628;
static const uint32_t TESTNET_NETWORK_ID = 1939510133;

CTokenNetworkParams::CTokenNetworkParams(uint32_t networkId, const std::string& name, const std::string& label,
                                         const std::string& formName) :
    m_network_id(networkId),
    m_name(name),
    m_label(label),
    m_form_name(formName)
{
}

std::string CTokenNetworkParams::FormLabel() const
{
    return strprintf("%s - Network ID: %u", m_form_name, m_network_id);
}

CTokenNetworks::CTokenNetworks(const std::vector<CTokenNetworkParams>& networks) : m_networks(networks)
{
}

const CTokenNetworkParams* CTokenNetworks::Find(uint32_t networkId) const
{
    for (const CTokenNetworkParams& network : m_networks) {
        if (network.NetworkId() == networkId)
            return &network;
    }
    return nullptr;
}

/** Extract the digits following "Network ID:" and optional blanks. */
static bool ExtractNetworkId(const std::string& str, std::string& digits)
{
    static const std::string marker = "Network ID:";
    size_t pos = str.find(marker);
    if (pos == std::string::npos)
        return false;
    pos += marker.size();
    while (pos < str.size() && isspace((unsigned char)str[pos]))
        ++pos;
    size_t end = pos;
    while (end < str.size() && isdigit((unsigned char)str[end]))
        ++end;
    if (end == pos)
        return false;
    digits = str.substr(pos, end - pos);
    return true;
}

const CTokenNetworkParams* CTokenNetworks::Parse(const std::string& str) const
{
    for (const CTokenNetworkParams& network : m_networks) {
        if (str == network.FormLabel() || str == network.Label())
            return &network;
    }

    std::string digits;
    if (!ExtractNetworkId(str, digits))
        digits = str;
    int64_t id;
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos || !ParseInt64(digits, &id))
        return nullptr;
    if (id < 0 || id > 0xffffffff)
        return nullptr;
    return Find((uint32_t)id);
}

std::unique_ptr<const CTokenNetworks> CreateTokenNetworks()
{
    std::vector<CTokenNetworkParams> networks;
    networks.emplace_back(PROD_NETWORK_ID, "Tapyrus API", "prod", "Tapyrus API (prod)");
    networks.emplace_back(TESTNET_NETWORK_ID, "Tapyrus Testnet", "testnet", "Tapyrus Testnet");
    return std::unique_ptr<const CTokenNetworks>(new CTokenNetworks(networks));
}
