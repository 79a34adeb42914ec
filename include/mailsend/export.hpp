#pragma once

#if defined(MAILSEND_STATIC_DEFINE)
#  ifndef MAILSEND_EXPORT
#    define MAILSEND_EXPORT
#  endif
#else
#  ifndef MAILSEND_EXPORT
#    if defined(__GNUC__) && __GNUC__ >= 4
#      define MAILSEND_EXPORT __attribute__((visibility("default")))
#    else
#      define MAILSEND_EXPORT
#    endif
#  endif
#endif
