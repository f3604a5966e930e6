// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "TestCrypto.hh"

#include <stdexcept>
#include <utility>

#include <boost/json.hpp>
#include <fmt/format.h>
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include "sigstore/BundleLoader.hh"
#include "sigstore/CryptographicAlgorithms.hh"
#include "sigstore/Dsse.hh"
#include "utils/Base64.hh"
#include "utils/Hex.hh"

namespace attest::test
{
  namespace
  {
    constexpr std::int64_t LOG_INDEX = 42;
    constexpr const char *CHECKPOINT_ORIGIN = "rekor.test - 1";

    std::string bio_to_string(BIO *bio)
    {
      char *data = nullptr;
      long size = BIO_get_mem_data(bio, &data);
      return {data, static_cast<std::size_t>(size)};
    }

    std::string sha256(const std::string &data)
    {
      return attest::sigstore::compute_digest(attest::sigstore::DigestAlgorithm::SHA256, data).value();
    }

    void add_extension(X509 *cert, X509 *issuer, int nid, const char *value)
    {
      X509V3_CTX ctx;
      X509V3_set_ctx_nodb(&ctx);
      X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
      X509_EXTENSION *ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
      if (ext == nullptr)
        {
          throw std::runtime_error(fmt::format("failed to create extension {}", value));
        }
      X509_add_ext(cert, ext, -1);
      X509_EXTENSION_free(ext);
    }

    std::shared_ptr<X509> new_certificate(const TestKey &key, const std::string &common_name, long not_before, long not_after)
    {
      static long serial = 1;

      std::shared_ptr<X509> cert(X509_new(), X509_free);
      X509_set_version(cert.get(), 2);
      ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), serial++);
      X509_time_adj_ex(X509_getm_notBefore(cert.get()), 0, not_before, nullptr);
      X509_time_adj_ex(X509_getm_notAfter(cert.get()), 0, not_after, nullptr);
      X509_set_pubkey(cert.get(), key.get());

      X509_NAME *name = X509_get_subject_name(cert.get());
      X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char *>("attest test"), -1, -1, 0);
      X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char *>(common_name.c_str()), -1, -1, 0);
      return cert;
    }
  } // namespace

  TestKey TestKey::generate()
  {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), EVP_PKEY_CTX_free);
    EVP_PKEY *pkey = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1
        || EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) != 1 || EVP_PKEY_keygen(ctx.get(), &pkey) != 1)
      {
        throw std::runtime_error("failed to generate EC key");
      }

    TestKey key;
    key.key = std::shared_ptr<EVP_PKEY>(pkey, EVP_PKEY_free);
    return key;
  }

  EVP_PKEY *TestKey::get() const
  {
    return key.get();
  }

  std::string TestKey::public_key_pem() const
  {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    PEM_write_bio_PUBKEY(bio.get(), key.get());
    return bio_to_string(bio.get());
  }

  std::string TestKey::public_key_der() const
  {
    unsigned char *der = nullptr;
    int size = i2d_PUBKEY(key.get(), &der);
    if (size <= 0)
      {
        throw std::runtime_error("failed to encode public key");
      }
    std::string result(reinterpret_cast<char *>(der), static_cast<std::size_t>(size));
    OPENSSL_free(der);
    return result;
  }

  std::string TestKey::sign(const std::string &data) const
  {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    std::size_t size = 0;
    const auto *input = reinterpret_cast<const unsigned char *>(data.data());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1
        || EVP_DigestSign(ctx.get(), nullptr, &size, input, data.size()) != 1)
      {
        throw std::runtime_error("failed to initialize signing");
      }

    std::string signature(size, '\0');
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char *>(signature.data()), &size, input, data.size()) != 1)
      {
        throw std::runtime_error("failed to sign");
      }
    signature.resize(size);
    return signature;
  }

  TestCertificate::TestCertificate(std::shared_ptr<X509> x509)
    : x509(std::move(x509))
  {
  }

  X509 *TestCertificate::get() const
  {
    return x509.get();
  }

  std::string TestCertificate::der() const
  {
    unsigned char *der = nullptr;
    int size = i2d_X509(x509.get(), &der);
    if (size <= 0)
      {
        throw std::runtime_error("failed to encode certificate");
      }
    std::string result(reinterpret_cast<char *>(der), static_cast<std::size_t>(size));
    OPENSSL_free(der);
    return result;
  }

  std::string TestCertificate::pem() const
  {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    PEM_write_bio_X509(bio.get(), x509.get());
    return bio_to_string(bio.get());
  }

  TestCertificate create_ca_certificate(const TestKey &key, const std::string &common_name)
  {
    constexpr long DAY = 24 * 3600;
    auto cert = new_certificate(key, common_name, -DAY, 2 * DAY);
    X509_set_issuer_name(cert.get(), X509_get_subject_name(cert.get()));
    add_extension(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE");
    add_extension(cert.get(), cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
    X509_sign(cert.get(), key.get(), EVP_sha256());
    return TestCertificate(cert);
  }

  TestCertificate create_leaf_certificate(const TestKey &key, const TestKey &issuer_key, const TestCertificate &issuer, const LeafOptions &options)
  {
    auto cert = new_certificate(key, "sigstore-signer", options.not_before.count(), options.not_after.count());
    X509_set_issuer_name(cert.get(), X509_get_subject_name(issuer.get()));
    add_extension(cert.get(), issuer.get(), NID_basic_constraints, "critical,CA:FALSE");
    add_extension(cert.get(), issuer.get(), NID_key_usage, "critical,digitalSignature");
    add_extension(cert.get(), issuer.get(), NID_ext_key_usage, options.code_signing ? "codeSigning" : "serverAuth");
    add_extension(cert.get(), issuer.get(), NID_subject_alt_name, fmt::format("email:{}", options.email).c_str());
    X509_sign(cert.get(), issuer_key.get(), EVP_sha256());
    return TestCertificate(cert);
  }

  std::string in_toto_statement(const std::string &subject_sha256)
  {
    boost::json::object statement{
      {"_type", "https://in-toto.io/Statement/v1"},
      {"subject", boost::json::array{boost::json::object{{"name", "artifact.bin"}, {"digest", boost::json::object{{"sha256", subject_sha256}}}}}},
      {"predicateType", "https://slsa.dev/provenance/v1"},
      {"predicate", boost::json::object{}},
    };
    return boost::json::serialize(statement);
  }

  TestSigstore::TestSigstore(const LeafOptions &leaf_options)
    : ca_key(TestKey::generate())
    , ca_certificate(create_ca_certificate(ca_key, "sigstore-test-ca"))
    , leaf_key(TestKey::generate())
    , leaf_certificate(create_leaf_certificate(leaf_key, ca_key, ca_certificate, leaf_options))
    , log_key(TestKey::generate())
    , log_id(sha256(log_key.public_key_der()))
  {
    integrated_time = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count() - 60;
  }

  std::string TestSigstore::trusted_root_json() const
  {
    using attest::utils::Base64;

    boost::json::object root{
      {"mediaType", "application/vnd.dev.sigstore.trustedroot+json;version=0.1"},
      {"tlogs",
       boost::json::array{boost::json::object{
         {"baseUrl", "https://rekor.test"},
         {"hashAlgorithm", "SHA2_256"},
         {"publicKey",
          boost::json::object{{"rawBytes", Base64::encode(log_key.public_key_der())},
                              {"keyDetails", "PKIX_ECDSA_P256_SHA_256"},
                              {"validFor", boost::json::object{{"start", "2020-01-01T00:00:00Z"}}}}},
         {"logId", boost::json::object{{"keyId", Base64::encode(log_id)}}},
       }}},
      {"certificateAuthorities",
       boost::json::array{boost::json::object{
         {"subject", boost::json::object{{"organization", "attest test"}, {"commonName", "sigstore-test-ca"}}},
         {"uri", "https://fulcio.test"},
         {"certChain", boost::json::object{{"certificates", boost::json::array{boost::json::object{{"rawBytes", Base64::encode(ca_certificate.der())}}}}}},
         {"validFor", boost::json::object{{"start", "2020-01-01T00:00:00Z"}}},
       }}},
      {"ctlogs", boost::json::array{}},
      {"timestampAuthorities", boost::json::array{}},
    };
    return boost::json::serialize(root);
  }

  void TestSigstore::add_log_entry(v1::Bundle &bundle, const std::string &kind, const std::string &body) const
  {
    using attest::utils::Base64;
    using attest::utils::Hex;

    auto *entry = bundle.mutable_verification_material()->add_tlog_entries();
    entry->set_log_index(LOG_INDEX);
    entry->mutable_log_id()->set_key_id(log_id);
    entry->mutable_kind_version()->set_kind(kind);
    entry->mutable_kind_version()->set_version("0.0.1");
    entry->set_integrated_time(integrated_time);
    entry->set_canonicalized_body(body);

    auto promise = fmt::format(R"({{"body":"{}","integratedTime":{},"logID":"{}","logIndex":{}}})",
                               Base64::encode(body),
                               integrated_time,
                               Hex::encode(log_id),
                               LOG_INDEX);
    entry->mutable_inclusion_promise()->set_signed_entry_timestamp(log_key.sign(promise));

    // Two leaf tree: the entry and one neighbour.
    auto leaf_hash = sha256(std::string(1, '\0') + body);
    auto sibling_hash = sha256(std::string(1, '\0') + "neighbour");
    auto root_hash = sha256(std::string(1, '\1') + leaf_hash + sibling_hash);

    auto *proof = entry->mutable_inclusion_proof();
    proof->set_log_index(0);
    proof->set_tree_size(2);
    proof->set_root_hash(root_hash);
    proof->add_hashes(sibling_hash);

    auto note = fmt::format("{}\n2\n{}\n", CHECKPOINT_ORIGIN, Base64::encode(root_hash));
    auto note_signature = Base64::encode(log_id.substr(0, 4) + log_key.sign(note));
    proof->mutable_checkpoint()->set_envelope(fmt::format("{}\n— rekor.test {}\n", note, note_signature));
  }

  std::shared_ptr<v1::Bundle> TestSigstore::create_dsse_bundle(const std::string &subject_sha256) const
  {
    using attest::utils::Base64;
    using attest::utils::Hex;

    auto bundle = std::make_shared<v1::Bundle>();
    bundle->set_media_type("application/vnd.dev.sigstore.bundle.v0.3+json");
    bundle->mutable_verification_material()->mutable_certificate()->set_raw_bytes(leaf_certificate.der());

    const std::string payload_type = "application/vnd.in-toto+json";
    const std::string payload = in_toto_statement(subject_sha256);
    const std::string signature = leaf_key.sign(attest::sigstore::pae(payload_type, payload));

    auto *envelope = bundle->mutable_dsse_envelope();
    envelope->set_payload(payload);
    envelope->set_payload_type(payload_type);
    auto *sig = envelope->add_signatures();
    sig->set_sig(signature);

    boost::json::object body{
      {"apiVersion", "0.0.1"},
      {"kind", "dsse"},
      {"spec",
       boost::json::object{
         {"payloadHash", boost::json::object{{"algorithm", "sha256"}, {"value", Hex::encode(sha256(payload))}}},
         {"signatures",
          boost::json::array{boost::json::object{{"signature", Base64::encode(signature)}, {"verifier", Base64::encode(leaf_certificate.pem())}}}},
       }},
    };
    add_log_entry(*bundle, "dsse", boost::json::serialize(body));
    return bundle;
  }

  std::shared_ptr<v1::Bundle> TestSigstore::create_message_signature_bundle(const std::string &artifact) const
  {
    using attest::utils::Base64;
    using attest::utils::Hex;

    auto bundle = std::make_shared<v1::Bundle>();
    bundle->set_media_type("application/vnd.dev.sigstore.bundle+json;version=0.3");
    bundle->mutable_verification_material()->mutable_certificate()->set_raw_bytes(leaf_certificate.der());

    const std::string digest = sha256(artifact);
    const std::string signature = leaf_key.sign(artifact);

    auto *message_signature = bundle->mutable_message_signature();
    message_signature->mutable_message_digest()->set_algorithm(v1::SHA2_256);
    message_signature->mutable_message_digest()->set_digest(digest);
    message_signature->set_signature(signature);

    boost::json::object body{
      {"apiVersion", "0.0.1"},
      {"kind", "hashedrekord"},
      {"spec",
       boost::json::object{
         {"data", boost::json::object{{"hash", boost::json::object{{"algorithm", "sha256"}, {"value", Hex::encode(digest)}}}}},
         {"signature",
          boost::json::object{{"content", Base64::encode(signature)},
                              {"publicKey", boost::json::object{{"content", Base64::encode(leaf_certificate.pem())}}}}},
       }},
    };
    add_log_entry(*bundle, "hashedrekord", boost::json::serialize(body));
    return bundle;
  }

  std::string TestSigstore::bundle_json(const v1::Bundle &bundle) const
  {
    return attest::sigstore::BundleLoader::to_json(bundle).value();
  }

  const TestKey &TestSigstore::get_leaf_key() const
  {
    return leaf_key;
  }

  const TestCertificate &TestSigstore::get_leaf_certificate() const
  {
    return leaf_certificate;
  }

  const TestKey &TestSigstore::get_log_key() const
  {
    return log_key;
  }

  const std::string &TestSigstore::get_log_id() const
  {
    return log_id;
  }
} // namespace attest::test
