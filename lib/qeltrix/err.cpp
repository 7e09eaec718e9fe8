#include "qeltrix/err.hpp"

namespace qeltrix {

const char* strerr(int code){
  switch (code){
    case E_OK:        return "ok";
    case E_IO:        return "io error";
    case E_FORMAT:    return "format error";
    case E_INTEGRITY: return "integrity error";
    case E_SIGNATURE: return "signature error";
    case E_UNWRAP:    return "key unwrap error";
    case E_CONFIG:    return "configuration error";
    case E_CRYPTO:    return "crypto error";
    default:          return "unknown error";
  }
}

}
