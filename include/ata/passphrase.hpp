#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ata {

// Supplies the passphrase of an encrypted archive, only when it is needed
class PassphraseProvider {
public:
  virtual ~PassphraseProvider() = default;

  // confirm is true when a new archive is created. std::nullopt means the
  // user declined.
  virtual std::optional<std::string> passphrase(bool confirm) = 0;
};

// Provider returning a passphrase known up front
class FixedPassphrase : public PassphraseProvider {
public:
  explicit FixedPassphrase(std::string passphrase) : passphrase_(std::move(passphrase)) {}

  std::optional<std::string> passphrase(bool) override {
    ++requests_;
    return passphrase_;
  }

  // Number of times the passphrase was asked for
  int requests() const { return requests_; }

private:
  std::string passphrase_;
  int requests_ = 0;
};

} // namespace ata
