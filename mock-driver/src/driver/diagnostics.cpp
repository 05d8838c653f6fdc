#include "diagnostics.hpp"

namespace mock_odbc {

DiagnosticRecord make_diagnostic(const std::string& sqlstate,
                                  SQLINTEGER native_error,
                                  const std::string& message,
                                  const std::string& server_name) {
    DiagnosticRecord rec;
    rec.sqlstate = sqlstate;
    rec.native_error = native_error;
    rec.message = "[Mock][" + server_name + "] " + message;
    // IM and HY states are ODBC-defined, the rest come from SQL:1999
    bool odbc_state = sqlstate.compare(0, 2, "IM") == 0 || sqlstate.compare(0, 2, "HY") == 0;
    rec.class_origin = odbc_state ? "ODBC 3.0" : "ISO 9075";
    rec.subclass_origin = odbc_state ? "ODBC 3.0" : "ISO 9075";
    rec.server_name = server_name;
    return rec;
}

} // namespace mock_odbc
