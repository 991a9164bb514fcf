// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <logging.h>
#include <pubkey.h>
#include <token/chainquery.h>
#include <token/metadata.h>
#include <token/networkparams.h>
#include <token/verification.h>
#include <util.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdio.h>
#include <stdlib.h>

#include <univalue.h>

static const int CONTINUE_EXECUTION=-1;
static const char* const DEFAULT_NETWORK = "prod";
static const bool DEFAULT_CHAIN_CHECK = true;

static void SetupTokenRegistryVerifyArgs()
{
    gArgs.AddArg("-?", "This help message", false, OptionsCategory::OPTIONS);
    gArgs.AddArg("-conf=<file>", "Read options from a configuration file. Network specific options go in a [prod] or [testnet] section", false, OptionsCategory::OPTIONS);
    gArgs.AddArg("-network=<network>", strprintf("Token network: prod, testnet, a network id or the registration form label (default: %s)", DEFAULT_NETWORK), false, OptionsCategory::OPTIONS);

    // Verification options
    gArgs.AddArg("-colorid=<colorid>", "Claimed Color ID to verify", false, OptionsCategory::VERIFY);
    gArgs.AddArg("-derive", "Derive and print the Color ID instead of verifying a claim", false, OptionsCategory::VERIFY);
    gArgs.AddArg("-type=<type>", "Token type used with -derive: reissuable, non-reissuable or nft", false, OptionsCategory::VERIFY);
    gArgs.AddArg("-metadata=<file>", "Read the token metadata JSON from <file>", false, OptionsCategory::VERIFY);
    gArgs.AddArg("-metadatajson=<json>", "Token metadata JSON given inline", false, OptionsCategory::VERIFY);
    gArgs.AddArg("-paymentbase=<pubkey>", "Compressed payment base public key in hex", false, OptionsCategory::VERIFY);
    gArgs.AddArg("-txid=<txid>", "Transaction id of the issuing outpoint (non-reissuable tokens and NFTs)", false, OptionsCategory::VERIFY);
    gArgs.AddArg("-index=<n>", "Output index of the issuing outpoint (non-reissuable tokens and NFTs)", false, OptionsCategory::VERIFY);
    gArgs.AddArg("-printmetadata", "Include the metadata document to store with the result", false, OptionsCategory::VERIFY);

    // Chain check options
    gArgs.AddArg("-chaincheck", strprintf("Check the issuing output script through the explorer (default: %u)", DEFAULT_CHAIN_CHECK), false, OptionsCategory::CHAIN_CHECK);
    gArgs.AddArg("-explorerurl=<url>", "Base URL of the explorer REST API of the selected network", false, OptionsCategory::CHAIN_CHECK);
    gArgs.AddArg("-timeout=<n>", strprintf("Timeout in seconds for the explorer lookup (default: %d)", DEFAULT_HTTP_CLIENT_TIMEOUT), false, OptionsCategory::CHAIN_CHECK);

    // Debugging options
    gArgs.AddArg("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: " + ListLogCategories() + ".", false, OptionsCategory::DEBUG_TEST);
    gArgs.AddArg("-printtoconsole", "Send trace/debug info to stderr (default: 1)", false, OptionsCategory::DEBUG_TEST);
    gArgs.AddArg("-debuglogfile=<file>", strprintf("Also write trace/debug info to <file> (default: none, e.g. %s)", DEFAULT_DEBUGLOGFILE), false, OptionsCategory::DEBUG_TEST);

    // Hidden
    gArgs.AddArg("-h", "", false, OptionsCategory::HIDDEN);
    gArgs.AddArg("-help", "", false, OptionsCategory::HIDDEN);
}

static bool InitLogging(std::string& error)
{
    g_logger->m_print_to_console = gArgs.GetBoolArg("-printtoconsole", true);
    if (gArgs.IsArgSet("-debuglogfile") && !gArgs.IsArgNegated("-debuglogfile")) {
        g_logger->m_file_path = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
        g_logger->m_print_to_file = true;
        if (!g_logger->OpenDebugLog()) {
            error = strprintf("Could not open debug log file %s", g_logger->m_file_path);
            return false;
        }
    }

    if (gArgs.IsArgSet("-debug")) {
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        if (std::none_of(categories.begin(), categories.end(),
            [](std::string cat){return cat == "0" || cat == "none";})) {
            for (const auto& cat : categories) {
                if (!g_logger->EnableCategory(cat)) {
                    error = strprintf("Unsupported logging category -debug=%s", cat);
                    return false;
                }
            }
        }
    }
    return true;
}

//
// This function returns either one of EXIT_ codes when it's expected to stop the process or
// CONTINUE_EXECUTION when it's expected to continue further.
//
static int AppInit(int argc, char* argv[])
{
    //
    // Parameters
    //
    SetupTokenRegistryVerifyArgs();
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (argc < 2 || HelpRequested(gArgs)) {
        // First part of help message is specific to this utility
        std::string strUsage = std::string(PACKAGE_NAME) + " tokenregistry-verify utility version " + PACKAGE_VERSION + "\n\n" +
                               "Usage:   tokenregistry-verify -colorid=<colorid> -paymentbase=<pubkey> -metadata=<file> [options]\n" +
                               "         Verify a claimed Color ID against its metadata and payment base\n" +
                               "   or:   tokenregistry-verify -derive -type=<type> -paymentbase=<pubkey> -metadata=<file> [options]\n" +
                               "         Derive the Color ID of a token\n" +
                               "\n";
        strUsage += gArgs.GetHelpMessage();

        fprintf(stdout, "%s", strUsage.c_str());

        if (argc < 2) {
            fprintf(stderr, "Error: too few parameters\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (gArgs.IsArgSet("-conf") && !gArgs.ReadConfigFile(gArgs.GetArg("-conf", ""), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (!InitLogging(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    return CONTINUE_EXECUTION;
}

static bool ReadMetadataArg(UniValue& metadata, std::string& error)
{
    std::string text;
    if (gArgs.IsArgSet("-metadatajson")) {
        text = gArgs.GetArg("-metadatajson", "");
    } else if (gArgs.IsArgSet("-metadata")) {
        const std::string path = gArgs.GetArg("-metadata", "");
        std::ifstream file(path);
        if (!file.good()) {
            error = strprintf("cannot open metadata file %s", path);
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        text = buffer.str();
    } else {
        error = "no metadata given, use -metadata or -metadatajson";
        return false;
    }
    return ReadMetadataJSON(text, metadata, error);
}

static bool ReadVerificationInput(VerificationInput& input, std::string& error)
{
    if (!ReadMetadataArg(input.metadata, error))
        return false;

    input.colorId = gArgs.GetArg("-colorid", "");
    input.paymentBase = gArgs.GetArg("-paymentbase", "");
    if (gArgs.IsArgSet("-txid"))
        input.txid = gArgs.GetArg("-txid", "");
    if (gArgs.IsArgSet("-index")) {
        int64_t index;
        if (!ParseInt64(gArgs.GetArg("-index", ""), &index)) {
            error = strprintf("invalid output index %s", gArgs.GetArg("-index", ""));
            return false;
        }
        input.index = index;
    }
    return true;
}

static void PrintResult(const UniValue& result)
{
    fprintf(stdout, "%s\n", result.write(2).c_str());
}

static int DeriveCommand(const VerificationInput& input)
{
    TokenTypes type;
    if (!ParseTokenType(gArgs.GetArg("-type", ""), type)) {
        fprintf(stderr, "Error: -derive needs -type=reissuable, non-reissuable or nft.\n");
        return EXIT_FAILURE;
    }

    CVerificationState state;
    DerivationRequest request;
    DerivationResult derived;
    if (!ParseDerivationRequest(input, type, request, state) || !DeriveColorId(request, derived, state)) {
        for (const std::string& reason : state.GetRejectReasons())
            fprintf(stderr, "Error: %s\n", reason.c_str());
        fprintf(stderr, "Error: %s\n", FormatStateMessage(state).c_str());
        return EXIT_FAILURE;
    }

    UniValue result = derived.ToUniValue();
    if (gArgs.GetBoolArg("-printmetadata", false))
        result.pushKV("metadata", GetRequestMetadata(request).ToUniValue(true));
    PrintResult(result);
    return EXIT_SUCCESS;
}

static int VerifyCommand(const VerificationInput& input, const CTokenNetworkParams& network)
{
    std::unique_ptr<CChainQuery> chain;
    ColorIdentifier claimed;
    if (gArgs.GetBoolArg("-chaincheck", DEFAULT_CHAIN_CHECK) && ParseColorIdentifier(input.colorId, claimed) && IsOutPointBound(claimed.type)) {
        const std::string explorerUrl = gArgs.GetArg("-explorerurl", "");
        if (explorerUrl.empty()) {
            fprintf(stderr, "Error: no explorer URL for network %s. Set -explorerurl or disable the check with -nochaincheck.\n", network.Label().c_str());
            return EXIT_FAILURE;
        }
        const std::string timeoutArg = gArgs.GetArg("-timeout", strprintf("%d", DEFAULT_HTTP_CLIENT_TIMEOUT));
        int timeout;
        if (!ParseHttpClientTimeout(timeoutArg, timeout)) {
            fprintf(stderr, "Error: Invalid -timeout=%s. Give a number of seconds between 1 and %d.\n", timeoutArg.c_str(), std::numeric_limits<int32_t>::max());
            return EXIT_FAILURE;
        }
        chain.reset(new CExplorerChainQuery(explorerUrl, timeout));
    }

    CVerificationState state;
    VerificationResult result;
    bool fMatched = VerifyColorId(input, chain.get(), result, state);

    UniValue reply = result.ToUniValue(gArgs.GetBoolArg("-printmetadata", false));
    reply.pushKV("network_id", (int64_t)network.NetworkId());
    reply.pushKV("network", network.Name());
    reply.pushKV("stage", GetVerifyStageName(state.GetStage()));
    if (!state.IsValid()) {
        UniValue reasons(UniValue::VARR);
        for (const std::string& reason : state.GetRejectReasons())
            reasons.push_back(reason);
        reply.pushKV("failure", GetVerifyFailureName(state.GetFailure()));
        reply.pushKV("reject_reasons", reasons);
        if (!state.GetDebugMessage().empty())
            reply.pushKV("debug", state.GetDebugMessage());
    }
    PrintResult(reply);

    if (!fMatched)
        LogPrintf("Verification failed: %s\n", FormatStateMessage(state));
    return fMatched ? EXIT_SUCCESS : EXIT_FAILURE;
}

static int CommandLine()
{
    std::unique_ptr<const CTokenNetworks> networks = CreateTokenNetworks();
    const std::string networkArg = gArgs.GetArg("-network", DEFAULT_NETWORK);
    const CTokenNetworkParams* network = networks->Parse(networkArg);
    if (!network) {
        fprintf(stderr, "Error: Invalid network %s. Select Tapyrus API (prod) or Tapyrus Testnet.\n", networkArg.c_str());
        return EXIT_FAILURE;
    }
    gArgs.SelectConfigNetwork(network->Label());

    const bool fDerive = gArgs.GetBoolArg("-derive", false);
    if (!fDerive && !gArgs.IsArgSet("-colorid")) {
        fprintf(stderr, "Error: -colorid is required unless -derive is given.\n");
        return EXIT_FAILURE;
    }

    VerificationInput input;
    std::string error;
    if (!ReadVerificationInput(input, error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    // This is for using CPubKey.AddTweak().
    ECCVerifyHandle globalVerifyHandle;

    if (fDerive)
        return DeriveCommand(input);
    return VerifyCommand(input, *network);
}

int main(int argc, char* argv[])
{
    SetupEnvironment();

    try {
        int ret = AppInit(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    }
    catch (const std::exception& e) {
        PrintExceptionContinue(&e, "AppInit()");
        return EXIT_FAILURE;
    } catch (...) {
        PrintExceptionContinue(nullptr, "AppInit()");
        return EXIT_FAILURE;
    }

    int ret = EXIT_FAILURE;
    try {
        ret = CommandLine();
    }
    catch (const std::exception& e) {
        PrintExceptionContinue(&e, "CommandLine()");
    } catch (...) {
        PrintExceptionContinue(nullptr, "CommandLine()");
    }
    return ret;
}
