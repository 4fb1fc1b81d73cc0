#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <memory>
#include <new>

namespace authly {

// Generic RAII aliases (function pointer deleters keep type size = one pointer)
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;
using X509StorePtr = std::unique_ptr<X509_STORE, decltype(&::X509_STORE_free)>;
using X509StoreCtxPtr = std::unique_ptr<X509_STORE_CTX, decltype(&::X509_STORE_CTX_free)>;

// Stack of borrowed certificates: only the stack itself is freed, not its elements.
struct X509StackDel {
  void operator()(STACK_OF(X509) * stack) const noexcept { sk_X509_free(stack); }
};
using X509BorrowedStackPtr = std::unique_ptr<STACK_OF(X509), X509StackDel>;

// Helpers
inline BioPtr MakeBio(BIO* bio) {
  if (bio == nullptr) {
    throw std::bad_alloc();
  }
  return {bio, ::BIO_free};
}

inline BioPtr MakeMemBio(const void* data, int len) { return MakeBio(BIO_new_mem_buf(data, len)); }

// Allocate an empty memory BIO (equivalent to BIO_new(BIO_s_mem())) with RAII.
inline BioPtr MakeMemoryBio() { return MakeBio(BIO_new(BIO_s_mem())); }

inline X509Ptr MakeX509(X509* x509) {
  if (x509 == nullptr) {
    throw std::bad_alloc();
  }
  return {x509, ::X509_free};
}

inline PKeyPtr MakePKey(EVP_PKEY* pkey) {
  if (pkey == nullptr) {
    throw std::bad_alloc();
  }
  return {pkey, ::EVP_PKEY_free};
}

inline MdCtxPtr MakeMdCtx() {
  EVP_MD_CTX* ctx = ::EVP_MD_CTX_new();
  if (ctx == nullptr) {
    throw std::bad_alloc();
  }
  return {ctx, ::EVP_MD_CTX_free};
}

inline X509StoreCtxPtr MakeX509StoreCtx() {
  X509_STORE_CTX* ctx = ::X509_STORE_CTX_new();
  if (ctx == nullptr) {
    throw std::bad_alloc();
  }
  return {ctx, ::X509_STORE_CTX_free};
}

inline X509BorrowedStackPtr MakeX509BorrowedStack() {
  STACK_OF(X509)* stack = sk_X509_new_null();
  if (stack == nullptr) {
    throw std::bad_alloc();
  }
  return X509BorrowedStackPtr(stack);
}

}  // namespace authly
