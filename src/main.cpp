#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <certum/core/certificate.hpp>
#include <certum/core/hash.hpp>
#include <certum/core/hash_tree.hpp>
#include <certum/core/keys.hpp>
#include <certum/core/logging.hpp>
#include <certum/core/serializer.hpp>
#include <certum/core/verifier.hpp>

using namespace certum::core;

static void print_usage() {
  std::printf(
    "certum: certified state verification\n\n"
    "Usage:\n"
    "  certum demo-keys [--algorithm ec|ed25519] [--message MESSAGE]\n"
    "  certum demo-certificate [--canister HEX] [--time N] [--out FILE] [--root-key-out FILE]\n"
    "  certum verify --certificate FILE --root-key FILE --canister HEX [--path PATH]\n"
    "  certum lookup --certificate FILE --path PATH\n\n"
    "Options:\n"
    "  --algorithm  Key algorithm (default: ed25519)\n"
    "  --message    Message to sign (default: 'certum demo')\n"
    "  --canister   Canister id in hex (default: 00000000000000010101)\n"
    "  --time       Value certified at /time (default: 12345)\n"
    "  --out        Write the encoded certificate (CBOR) to FILE\n"
    "  --root-key-out  Write the DER root public key to FILE\n"
    "  --path       Lookup path such as /canister/0x0000000000000001/certified_data\n"
    "  --verbose    Debug logging (any command)\n"
  );
}

// Accepts "--name value" and "--name=value"; advances i past a separate value.
static bool read_option(int argc, char** argv, int& i, const std::string& name, std::string& out) {
  std::string arg = argv[i];
  if (arg.rfind(name + "=", 0) == 0) {
    out = arg.substr(name.size() + 1);
    return true;
  }
  if (arg == name && i + 1 < argc) {
    out = argv[++i];
    return true;
  }
  return false;
}

static std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot open " + path);
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out.good()) throw std::runtime_error("write failed: " + path);
}

// "/a/0xff01/c" -> {"a", {0xff, 0x01}, "c"}
static Path parse_path(const std::string& text) {
  Path path;
  std::string segment;
  auto flush = [&]() {
    if (segment.empty()) return;
    if (segment.rfind("0x", 0) == 0) {
      path.push_back(from_hex(segment.substr(2)));
    } else {
      path.push_back(label(segment));
    }
    segment.clear();
  };
  for (char c : text) {
    if (c == '/') flush();
    else segment.push_back(c);
  }
  flush();
  return path;
}

static void print_lookup(const VerifiedTree& verified, const Path& path) {
  auto result = verified.lookup_path(path);
  std::cout << "lookup " << path_to_string(path) << ": " << to_string(result.status);
  if (result.is_found()) std::cout << " " << to_hex(result.value);
  std::cout << "\n";
}

static int cmd_demo_keys(int argc, char** argv) {
  std::string algorithm = "ed25519";
  std::string message = "certum demo";
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (read_option(argc, argv, i, "--algorithm", algorithm) || read_option(argc, argv, i, "--message", message)) {
      continue;
    }
    if (arg == "--verbose") continue;
    std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
    print_usage();
    return 1;
  }

  auto key_pair = algorithm == "ec" ? generate_ec_keypair() : generate_ed25519_keypair();
  std::string priv_pem(key_pair.privkey_pem.begin(), key_pair.privkey_pem.end());

  std::cout << "Algorithm: " << algorithm << "\n";
  std::cout << "Message: " << message << "\n\n";
  std::cout << "Private Key (PEM):\n" << priv_pem << "\n";
  std::cout << "Public Key (DER hex):\n" << to_hex(key_pair.pubkey_der) << "\n";

  auto signature = sign_message(key_pair.privkey_pem, message);
  std::cout << "Signature (hex):\n" << to_hex(signature) << "\n";

  bool verified = verify_message(key_pair.pubkey_der, message, signature);
  std::cout << "Verification: " << (verified ? "OK" : "FAIL") << "\n";
  return 0;
}

static int cmd_demo_certificate(int argc, char** argv) {
  std::string canister_hex = "00000000000000010101";
  std::string time = "12345";
  std::string out_path;
  std::string key_out_path;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (read_option(argc, argv, i, "--canister", canister_hex) || read_option(argc, argv, i, "--time", time) ||
        read_option(argc, argv, i, "--out", out_path) || read_option(argc, argv, i, "--root-key-out", key_out_path)) {
      continue;
    }
    if (arg == "--verbose") continue;
    std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
    print_usage();
    return 1;
  }

  auto canister_id = from_hex(canister_hex);
  auto key_pair = generate_ed25519_keypair();

  auto tree = HashTree::fork(
    HashTree::labeled("canister",
      HashTree::labeled(canister_id,
        HashTree::labeled("certified_data", HashTree::leaf("certum demo data")))),
    HashTree::labeled("time", HashTree::leaf(time)));

  Certificate certificate;
  certificate.tree = tree;
  certificate.signature = sign_message(key_pair.privkey_pem, state_root_message(tree.digest()));

  auto encoded = encode_certificate(certificate);
  auto root_hash = tree.digest();
  std::cout << "root:        " << to_hex(root_hash) << "\n";
  std::cout << "signature:   " << certificate.signature.size() << " bytes\n";
  std::cout << "certificate: " << encoded.size() << " bytes (CBOR)\n";

  OpenSslSignatureScheme scheme;
  auto decoded = decode_certificate(encoded);
  auto result = verify_certificate(decoded, canister_id, key_pair.pubkey_der, scheme);
  std::cout << "verify: " << (result.is_valid ? "OK" : to_string(result.error)) << "\n";
  if (result.tree) {
    print_lookup(*result.tree, make_path({"time"}));
    print_lookup(*result.tree, {label("canister"), canister_id, label("certified_data")});
    print_lookup(*result.tree, make_path({"missing"}));

    auto witness = tree.witness({make_path({"time"})});
    std::cout << "witness root matches: " << (witness.digest() == root_hash ? "yes" : "no") << "\n";
  }

  if (!out_path.empty()) write_file(out_path, encoded);
  if (!key_out_path.empty()) write_file(key_out_path, key_pair.pubkey_der);
  return result.is_valid ? 0 : 2;
}

static int cmd_verify(int argc, char** argv) {
  std::string certificate_path;
  std::string root_key_path;
  std::string canister_hex;
  std::string path_text;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (read_option(argc, argv, i, "--certificate", certificate_path) ||
        read_option(argc, argv, i, "--root-key", root_key_path) ||
        read_option(argc, argv, i, "--canister", canister_hex) ||
        read_option(argc, argv, i, "--path", path_text)) {
      continue;
    }
    if (arg == "--verbose") continue;
    std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
    print_usage();
    return 1;
  }
  if (certificate_path.empty() || root_key_path.empty() || canister_hex.empty()) {
    std::fprintf(stderr, "verify needs --certificate, --root-key and --canister\n");
    return 1;
  }

  auto certificate = decode_certificate(read_file(certificate_path));
  auto root_key = read_file(root_key_path);
  auto canister_id = from_hex(canister_hex);

  OpenSslSignatureScheme scheme;
  auto result = verify_certificate(certificate, canister_id, root_key, scheme);
  if (!result.is_valid) {
    std::cout << "verify: FAIL (" << to_string(result.error) << ")\n";
    return 2;
  }
  std::cout << "verify: OK\n";
  std::cout << "root:   " << to_hex(result.tree->digest()) << "\n";
  if (!path_text.empty()) print_lookup(*result.tree, parse_path(path_text));
  return 0;
}

// Unverified inspection of a certificate's tree.
static int cmd_lookup(int argc, char** argv) {
  std::string certificate_path;
  std::string path_text;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (read_option(argc, argv, i, "--certificate", certificate_path) ||
        read_option(argc, argv, i, "--path", path_text)) {
      continue;
    }
    if (arg == "--verbose") continue;
    std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
    print_usage();
    return 1;
  }
  if (certificate_path.empty()) {
    std::fprintf(stderr, "lookup needs --certificate\n");
    return 1;
  }

  auto certificate = decode_certificate(read_file(certificate_path));
  std::cout << "root: " << to_hex(certificate.tree.digest()) << " (unverified)\n";
  if (path_text.empty()) {
    for (const auto& path : certificate.tree.list_paths()) std::cout << path_to_string(path) << "\n";
    return 0;
  }
  auto path = parse_path(path_text);
  auto result = certificate.tree.lookup_path(path);
  std::cout << "lookup " << path_to_string(path) << ": " << to_string(result.status);
  if (result.is_found()) std::cout << " " << to_hex(result.value);
  std::cout << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 0;
  }

  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--verbose") set_log_level(spdlog::level::debug);
  }

  if (!crypto_init()) {
    std::fprintf(stderr, "crypto_init failed\n");
    return 1;
  }

  const std::string command = argv[1];
  try {
    if (command == "demo-keys") return cmd_demo_keys(argc, argv);
    if (command == "demo-certificate") return cmd_demo_certificate(argc, argv);
    if (command == "verify") return cmd_verify(argc, argv);
    if (command == "lookup") return cmd_lookup(argc, argv);
  } catch (const SerializeError& ex) {
    std::fprintf(stderr, "Malformed certificate: %s\n", ex.what());
    return 1;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "Error: %s\n", ex.what());
    return 1;
  }

  print_usage();
  return command == "-h" || command == "--help" ? 0 : 1;
}
