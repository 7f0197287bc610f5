#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "apirest/api-rest-error.hpp"
#include "apirest/api-rest-module.hpp"
#include "apirest/cert-generator.hpp"
#include "apirest/cert-profile.hpp"
#include "apirest/config-resolver.hpp"
#include "apirest/http-status-code.hpp"
#include "apirest/temp-file.hpp"
#include "apirest/test-module-fixture.hpp"
#include "apirest/test-util.hpp"
#include "apirest/tls-client.hpp"

namespace apirest {

namespace {

// Real self-signed generation, counting calls.
class CountingCertGenerator : public CertGenerator {
 public:
  void generate(const CertProfile& profile, const std::string& certOutPath, const std::string& keyOutPath) override {
    ++nbCalls;
    _impl.generate(profile, certOutPath, keyOutPath);
  }

  std::atomic<int> nbCalls{0};

 private:
  SelfSignedCertGenerator _impl;
};

class FailingCertGenerator : public CertGenerator {
 public:
  void generate(const CertProfile&, const std::string&, const std::string&) override {
    throw std::runtime_error("entropy source unavailable");
  }
};

ApiRestModule::Options WithGenerator(std::shared_ptr<CertGenerator> generator) {
  auto options = test::TestModule::DefaultOptions();
  options.certGenerator = std::move(generator);
  return options;
}

}  // namespace

class ApiRestTlsTest : public ::testing::Test {
 protected:
  void configureTls(test::TestModule& tm) {
    tm.set(param::kCertificate, certPath).set(param::kKey, keyPath).set(param::kCertBits, "1024");
  }

  test::ScopedTempDir dir;
  std::string certPath{dir.pathOf("tls/cert.pem")};
  std::string keyPath{dir.pathOf("tls/key.pem")};
  std::shared_ptr<CountingCertGenerator> generator{std::make_shared<CountingCertGenerator>()};
};

TEST_F(ApiRestTlsTest, GeneratesMissingIdentityThenServesHttps) {
  test::TestModule tm(WithGenerator(generator));
  configureTls(tm);
  tm.set(param::kCertCommonName, "control.test");
  tm.module.start();
  EXPECT_TRUE(tm.module.isTls());
  EXPECT_EQ(generator->nbCalls.load(), 1);
  EXPECT_TRUE(std::filesystem::exists(certPath));
  EXPECT_TRUE(std::filesystem::exists(keyPath));
  const auto keyPerms = std::filesystem::status(keyPath).permissions();
  EXPECT_EQ(keyPerms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
            std::filesystem::perms::none);

  test::TlsClient client(tm.port());
  ASSERT_TRUE(client.handshakeOk());
  EXPECT_EQ(client.peerCommonName(), "control.test");
  const auto response = test::parseResponseOrThrow(client.get("/api/session"));
  EXPECT_EQ(response.statusCode, http::StatusCodeOK);
  EXPECT_EQ(response.header("X-Frame-Options"), "DENY");

  // plain HTTP is not served on the TLS port
  test::RequestOptions opt;
  opt.target = "/api/session";
  opt.timeout = std::chrono::milliseconds{300};
  const auto raw = test::request(tm.port(), opt);
  EXPECT_FALSE(raw && raw->starts_with("HTTP/1.1 200"));
}

TEST_F(ApiRestTlsTest, ExistingIdentityIsReusedUnchanged) {
  {
    test::TestModule tm(WithGenerator(generator));
    configureTls(tm);
    tm.module.start();
  }
  ASSERT_EQ(generator->nbCalls.load(), 1);
  const std::string certBefore = test::ReadFile(certPath);
  const std::string keyBefore = test::ReadFile(keyPath);

  test::TestModule tm(WithGenerator(generator));
  configureTls(tm);
  tm.module.start();
  EXPECT_EQ(generator->nbCalls.load(), 1);
  EXPECT_EQ(test::ReadFile(certPath), certBefore);
  EXPECT_EQ(test::ReadFile(keyPath), keyBefore);

  test::TlsClient client(tm.port());
  ASSERT_TRUE(client.handshakeOk());
  EXPECT_EQ(test::parseResponseOrThrow(client.get("/api/file")).statusCode, http::StatusCodeOK);
}

TEST_F(ApiRestTlsTest, MissingKeyOnlyRegeneratesBoth) {
  {
    test::TestModule tm(WithGenerator(generator));
    configureTls(tm);
    tm.module.start();
  }
  const std::string certBefore = test::ReadFile(certPath);
  std::filesystem::remove(keyPath);

  test::TestModule tm(WithGenerator(generator));
  configureTls(tm);
  tm.module.start();
  EXPECT_EQ(generator->nbCalls.load(), 2);
  EXPECT_NE(test::ReadFile(certPath), certBefore);
}

TEST_F(ApiRestTlsTest, GenerationFailure) {
  test::TestModule tm(WithGenerator(std::make_shared<FailingCertGenerator>()));
  configureTls(tm);
  try {
    tm.module.start();
    FAIL() << "expected an ApiRestError";
  } catch (const ApiRestError& ex) {
    EXPECT_EQ(ex.code(), ApiRestErrc::TlsBootstrapFailed);
    EXPECT_NE(std::string(ex.what()).find("entropy source unavailable"), std::string::npos);
  }
  EXPECT_EQ(tm.module.state(), ApiRestModule::State::Idle);
  EXPECT_FALSE(std::filesystem::exists(certPath));
  EXPECT_FALSE(std::filesystem::exists(keyPath));
}

TEST_F(ApiRestTlsTest, UnloadableIdentity) {
  std::filesystem::create_directories(std::filesystem::path(certPath).parent_path());
  test::WriteFile(certPath, "not a certificate");
  test::WriteFile(keyPath, "not a key");
  test::TestModule tm(WithGenerator(generator));
  configureTls(tm);
  try {
    tm.module.start();
    FAIL() << "expected an ApiRestError";
  } catch (const ApiRestError& ex) {
    EXPECT_EQ(ex.code(), ApiRestErrc::TlsBootstrapFailed);
  }
  EXPECT_EQ(generator->nbCalls.load(), 0);
  EXPECT_EQ(test::ReadFile(certPath), "not a certificate");
}

TEST_F(ApiRestTlsTest, InvalidCertificateProfile) {
  test::TestModule tm(WithGenerator(generator));
  configureTls(tm);
  tm.set(param::kCertBits, "128");
  try {
    tm.module.start();
    FAIL() << "expected an ApiRestError";
  } catch (const ApiRestError& ex) {
    EXPECT_EQ(ex.code(), ApiRestErrc::InvalidConfiguration);
  }
  EXPECT_EQ(generator->nbCalls.load(), 0);
}

TEST_F(ApiRestTlsTest, SinglePathMeansPlainHttp) {
  test::TestModule tm(WithGenerator(generator));
  tm.set(param::kCertificate, certPath);
  tm.module.start();
  EXPECT_FALSE(tm.module.isTls());
  EXPECT_EQ(generator->nbCalls.load(), 0);
  EXPECT_EQ(test::simpleGet(tm.port(), "/api/session").statusCode, http::StatusCodeOK);
}

}  // namespace apirest
