#include "internal/fs/path_guard.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using vaultd::fs::ResolvePath;

bool Denied(const std::string& base, const std::string& requested) {
  try {
    (void)ResolvePath(base, requested);
  } catch (const vaultd::util::AccessDenied&) {
    return true;
  }
  return false;
}

void TestPathsInsideBaseResolve() {
  assert(ResolvePath("/srv/vault", "notes/a.md").string() == "/srv/vault/notes/a.md");
  assert(ResolvePath("/srv/vault", "notes/../b.md").string() == "/srv/vault/b.md");
  assert(ResolvePath("/srv/vault/", "./c.md").string() == "/srv/vault/c.md");
}

void TestBaseItselfIsAllowed() {
  assert(ResolvePath("/srv/vault", ".").string() == "/srv/vault");
  assert(ResolvePath("/srv/vault", "").string() == "/srv/vault");
  assert(ResolvePath("/srv/vault", "notes/..").string() == "/srv/vault");
}

void TestTraversalIsBlocked() {
  assert(Denied("/srv/vault", "../etc/passwd"));
  assert(Denied("/srv/vault", "notes/../../etc"));
  assert(Denied("/srv/vault", "/etc/passwd"));
}

void TestSiblingWithSharedPrefixIsBlocked() {
  assert(Denied("/srv/vault", "../vault-other/x.md"));
}

void TestEmptyBaseIsDenied() {
  assert(Denied("", "a.md"));
}

void TestRelativeTo() {
  assert(vaultd::fs::RelativeTo("/srv/vault", "/srv/vault/notes/a.md") == "notes/a.md");
  assert(vaultd::fs::RelativeTo("/srv/vault", "/srv/vault") == ".");
}

} // namespace

int main() {
  TestPathsInsideBaseResolve();
  TestBaseItselfIsAllowed();
  TestTraversalIsBlocked();
  TestSiblingWithSharedPrefixIsBlocked();
  TestEmptyBaseIsDenied();
  TestRelativeTo();

  std::cout << "vaultd_unit_path_guard: pass\n";
  return 0;
}
