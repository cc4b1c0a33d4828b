#pragma once

#include "catalog/detector.hpp"

#include <string>
#include <vector>

namespace biip {

/**
 * @brief Exact-substring detector for harvested secret literals
 *
 * Literals are tried longest first. An occurrence that intersects a region
 * already claimed by a longer literal is skipped, so a secret that is a
 * substring of another secret never splits the longer one.
 */
class SecretLiteralDetector : public IDetector {
public:
    explicit SecretLiteralDetector(std::vector<SecretLiteral> literals);

    [[nodiscard]] std::string_view name() const override { return "secret_literals"; }

    void find(std::string_view text, uint32_t order, std::vector<Match>& out) const override;

private:
    std::vector<SecretLiteral> literals_;
};

/**
 * @brief Replaces every occurrence of the invoking user's login name
 */
class UsernameDetector : public IDetector {
public:
    UsernameDetector(std::string username, std::string token);

    [[nodiscard]] std::string_view name() const override { return "username"; }

    void find(std::string_view text, uint32_t order, std::vector<Match>& out) const override;

private:
    std::string username_;
    std::string token_;
    bool enabled_ = false;
};

/**
 * @brief Replaces the home-directory prefix of paths
 *
 * The occurrence must end the path component: "/home/al" does not match
 * inside "/home/alice".
 */
class HomeDirDetector : public IDetector {
public:
    HomeDirDetector(std::string home_dir, std::string token);

    [[nodiscard]] std::string_view name() const override { return "home_dir"; }

    void find(std::string_view text, uint32_t order, std::vector<Match>& out) const override;

private:
    std::string home_dir_;
    std::string token_;
};

} // namespace biip
