#include "apirest/tls-identity.hpp"

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "apirest/api-rest-error.hpp"
#include "apirest/base-fd.hpp"
#include "apirest/errno-throw.hpp"
#include "apirest/log.hpp"

namespace apirest {

namespace {

// Temporary file created next to its final destination so that the final rename stays on the same filesystem.
// Removed on destruction unless committed.
class StagedFile {
 public:
  explicit StagedFile(const std::filesystem::path& target) {
    std::string pattern = (target.parent_path() / ("." + target.filename().string() + ".XXXXXX")).string();
    BaseFd fd(::mkstemp(pattern.data()));
    if (!fd) {
      throw_errno("unable to create temporary file for {}", target.string());
    }
    _path = std::move(pattern);
  }

  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  ~StagedFile() {
    if (!_committed) {
      std::error_code ec;
      std::filesystem::remove(_path, ec);
    }
  }

  [[nodiscard]] const std::string& path() const noexcept { return _path; }

  [[nodiscard]] bool empty() const { return std::filesystem::file_size(_path) == 0; }

  void commitTo(const std::string& target, mode_t mode) {
    if (::chmod(_path.c_str(), mode) != 0) {
      throw_errno("chmod failed for {}", _path);
    }
    if (!renameTo(target)) {
      throw_errno("unable to rename {} to {}", _path, target);
    }
  }

  // Returns false, with errno set, on failure.
  bool renameTo(const std::string& target) noexcept {
    if (std::rename(_path.c_str(), target.c_str()) != 0) {
      return false;
    }
    _committed = true;
    return true;
  }

 private:
  std::string _path;
  bool _committed{false};
};

// Copy of a file about to be replaced, that can be put back in place if the replacement has to be rolled back.
class PreservedFile {
 public:
  explicit PreservedFile(const std::string& target) : _target(target) {
    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
      return;
    }
    _copy.emplace(target);
    std::filesystem::copy_file(target, _copy->path(), std::filesystem::copy_options::overwrite_existing);
    std::filesystem::permissions(_copy->path(), std::filesystem::status(target).permissions());
  }

  // Put the original file back, or remove the target if there was none.
  void restore() noexcept {
    if (!_copy) {
      std::error_code ec;
      std::filesystem::remove(_target, ec);
    } else if (!_copy->renameTo(_target)) {
      log::error("unable to restore {} from {}", _target, _copy->path());
    }
  }

 private:
  std::string _target;
  std::optional<StagedFile> _copy;
};

}  // namespace

TlsIdentityProvider::TlsIdentityProvider(std::shared_ptr<CertGenerator> generator) : _generator(std::move(generator)) {
  if (!_generator) {
    throw std::invalid_argument("TlsIdentityProvider requires a certificate generator");
  }
}

TlsIdentity TlsIdentityProvider::ensure(const std::string& certPath, const std::string& keyPath,
                                        const ProfileSupplier& profileSupplier) const {
  std::error_code ec;
  if (std::filesystem::exists(certPath, ec) && std::filesystem::exists(keyPath, ec)) {
    log::info("loading TLS key from {}", keyPath);
    log::info("loading TLS certificate from {}", certPath);
    return {certPath, keyPath, false};
  }

  log::info("generating TLS key to {}", keyPath);
  log::info("generating TLS certificate to {}", certPath);

  const CertProfile profile = profileSupplier();
  try {
    generate(certPath, keyPath, profile);
  } catch (const std::exception& ex) {
    throw ApiRestError(ApiRestErrc::TlsBootstrapFailed,
                       std::format("unable to generate TLS key/certificate: {}", ex.what()));
  }
  return {certPath, keyPath, true};
}

void TlsIdentityProvider::generate(const std::string& certPath, const std::string& keyPath,
                                   const CertProfile& profile) const {
  for (const std::string& target : {certPath, keyPath}) {
    const auto parent = std::filesystem::path(target).parent_path();
    if (!parent.empty()) {
      std::filesystem::create_directories(parent);
    }
  }

  StagedFile stagedCert(certPath);
  StagedFile stagedKey(keyPath);

  _generator->generate(profile, stagedCert.path(), stagedKey.path());

  if (stagedCert.empty() || stagedKey.empty()) {
    throw std::runtime_error("certificate generation produced an empty file");
  }

  // A failed certificate rename leaves the previous certificate untouched, only the key has to be preserved.
  PreservedFile previousKey(keyPath);
  stagedKey.commitTo(keyPath, S_IRUSR | S_IWUSR);
  try {
    stagedCert.commitTo(certPath, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
  } catch (const std::exception&) {
    previousKey.restore();
    throw;
  }
}

}  // namespace apirest
