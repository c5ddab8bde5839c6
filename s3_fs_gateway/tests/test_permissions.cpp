#include "permissions.hpp"

#include <cassert>
#include <iostream>

static config::Credential make_cred(std::vector<config::Permission> perms) {
  config::Credential c;
  c.access_key = "AK";
  c.secret_key = "SK";
  c.permissions = std::move(perms);
  return c;
}

int main() {
  assert(auth::glob_match("*", ""));
  assert(auth::glob_match("*", "anything/at/all"));
  assert(auth::glob_match("orders/*", "orders/2024/1.json"));
  assert(!auth::glob_match("orders/*", "invoices/2024/1.json"));
  assert(auth::glob_match("a?c", "abc"));
  assert(!auth::glob_match("a?c", "ac"));
  assert(auth::glob_match("*.json", "x/y/z.json"));
  assert(!auth::glob_match("*.json", "x/y/z.jsonl"));
  assert(auth::glob_match("a*b*c", "aXXbYYc"));
  assert(!auth::glob_match("Orders/*", "orders/1"));
  assert(!auth::glob_match("", "x"));

  // Default deny.
  assert(!auth::is_allowed(make_cred({}), "GetObject", "orders/1"));

  auto wildcard = make_cred({{"*", "*"}});
  assert(auth::is_allowed(wildcard, "PutObject", "photos/cat.png"));
  assert(auth::is_allowed(wildcard, "ListAllMyBuckets", "*"));

  auto reader = make_cred({{"GetObject", "orders/*"}, {"ListBucket", "orders"}});
  assert(auth::is_allowed(reader, "GetObject", "orders/2024/1.json"));
  assert(!auth::is_allowed(reader, "GetObject", "invoices/2024/1.json"));
  assert(!auth::is_allowed(reader, "PutObject", "orders/2024/1.json"));
  assert(auth::is_allowed(reader, "ListBucket", "orders"));
  assert(!auth::is_allowed(reader, "ListBucket", "orders2"));

  std::cout << "test_permissions passed\n";
  return 0;
}
