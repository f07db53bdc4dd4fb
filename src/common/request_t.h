#ifndef REQUEST_T_H
#define REQUEST_T_H

#include <string>

namespace request_t {
    enum request_t {
        GET,
        POST
    };

    inline std::string to_string(request_t method) {
        switch (method) {
            case GET: return "GET";
            case POST: return "POST";
        }
        return "UNKNOWN";
    }
}

#endif // REQUEST_T_H
