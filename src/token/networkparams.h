// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_TOKEN_NETWORKPARAMS_H
#define TOKENREGISTRY_TOKEN_NETWORKPARAMS_H

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

/**
 * A Tapyrus network tokens can be registered on. Instances are immutable.
 */
class CTokenNetworkParams
{
public:
    CTokenNetworkParams(uint32_t networkId, const std::string& name, const std::string& label,
                        const std::string& formName);

    uint32_t NetworkId() const { return m_network_id; }
    const std::string& Name() const { return m_name; }
    /** Short label, also the config file section of the network. */
    const std::string& Label() const { return m_label; }

    /** Label of the network in the registration form. */
    std::string FormLabel() const;

private:
    uint32_t m_network_id;
    std::string m_name;
    std::string m_label;
    std::string m_form_name;
};

/** Immutable table of known networks. */
class CTokenNetworks
{
public:
    explicit CTokenNetworks(const std::vector<CTokenNetworkParams>& networks);

    const std::vector<CTokenNetworkParams>& All() const { return m_networks; }

    const CTokenNetworkParams* Find(uint32_t networkId) const;

    /**
     * Resolve a user supplied network: the form label, any text containing
     * "Network ID: <id>", the bare id or the short label.
     * @returns nullptr if the network is unknown.
     */
    const CTokenNetworkParams* Parse(const std::string& str) const;

private:
    const std::vector<CTokenNetworkParams> m_networks;
};

/** The default table: "Tapyrus API" (prod) and "Tapyrus Testnet" (testnet). */
std::unique_ptr<const CTokenNetworks> CreateTokenNetworks();

#endif // TOKENREGISTRY_TOKEN_NETWORKPARAMS_H
