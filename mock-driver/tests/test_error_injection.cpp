// Error Injection Tests - Test FailOn parameter and error scenarios
#include <gtest/gtest.h>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>
#include <string>

class ErrorInjectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        SQLRETURN ret;

        ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &henv);
        ASSERT_EQ(ret, SQL_SUCCESS);

        ret = SQLSetEnvAttr(henv, SQL_ATTR_ODBC_VERSION,
                            reinterpret_cast<SQLPOINTER>(static_cast<intptr_t>(SQL_OV_ODBC3)), 0);
        ASSERT_EQ(ret, SQL_SUCCESS);

        ret = SQLAllocHandle(SQL_HANDLE_DBC, henv, &hdbc);
        ASSERT_EQ(ret, SQL_SUCCESS);
    }

    void TearDown() override {
        if (hstmt != SQL_NULL_HSTMT) {
            SQLFreeHandle(SQL_HANDLE_STMT, hstmt);
        }
        if (hdbc != SQL_NULL_HDBC) {
            SQLDisconnect(hdbc);
            SQLFreeHandle(SQL_HANDLE_DBC, hdbc);
        }
        if (henv != SQL_NULL_HENV) {
            SQLFreeHandle(SQL_HANDLE_ENV, henv);
        }
    }

    void ConnectWithConfig(const std::string& config) {
        std::string conn_str = "Driver={Mock ODBC Driver};" + config;
        SQLRETURN ret = SQLDriverConnect(hdbc, nullptr,
                                         reinterpret_cast<SQLCHAR*>(const_cast<char*>(conn_str.c_str())),
                                         SQL_NTS, nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT);
        ASSERT_TRUE(SQL_SUCCEEDED(ret)) << "Connection should succeed";

        ret = SQLAllocHandle(SQL_HANDLE_STMT, hdbc, &hstmt);
        ASSERT_TRUE(SQL_SUCCEEDED(ret));
    }

    SQLRETURN Prepare(const char* sql) {
        return SQLPrepare(hstmt, reinterpret_cast<SQLCHAR*>(const_cast<char*>(sql)), SQL_NTS);
    }

    std::string Sqlstate(SQLSMALLINT handle_type, SQLHANDLE handle) {
        SQLCHAR sqlstate[6] = {0};
        SQLINTEGER native_error = 0;
        SQLCHAR message[256] = {0};
        SQLSMALLINT length = 0;
        SQLRETURN ret = SQLGetDiagRec(handle_type, handle, 1, sqlstate, &native_error,
                                      message, sizeof(message), &length);
        if (ret != SQL_SUCCESS) return "";
        last_message = reinterpret_cast<char*>(message);
        return reinterpret_cast<char*>(sqlstate);
    }

    SQLHENV henv = SQL_NULL_HENV;
    SQLHDBC hdbc = SQL_NULL_HDBC;
    SQLHSTMT hstmt = SQL_NULL_HSTMT;
    std::string last_message;
};

TEST_F(ErrorInjectionTest, FailOnSQLPrepare) {
    ConnectWithConfig("Mode=Partial;FailOn=SQLPrepare;ErrorCode=42000");

    SQLRETURN ret = Prepare("SELECT USER_ID FROM USERS");
    EXPECT_EQ(ret, SQL_ERROR);
    EXPECT_EQ(Sqlstate(SQL_HANDLE_STMT, hstmt), "42000");
    EXPECT_NE(last_message.find("Simulated failure in SQLPrepare"), std::string::npos);
}

TEST_F(ErrorInjectionTest, FailOnSQLDescribeCol) {
    ConnectWithConfig("Mode=Partial;FailOn=SQLDescribeCol;ErrorCode=HY000");

    ASSERT_EQ(Prepare("SELECT USER_ID FROM USERS"), SQL_SUCCESS);

    SQLSMALLINT num_cols = 0;
    EXPECT_EQ(SQLNumResultCols(hstmt, &num_cols), SQL_SUCCESS);
    EXPECT_EQ(num_cols, 1);

    SQLCHAR name[64] = {0};
    SQLSMALLINT name_len = 0, data_type = 0, digits = 0, nullable = 0;
    SQLULEN size = 0;
    SQLRETURN ret = SQLDescribeCol(hstmt, 1, name, sizeof(name), &name_len,
                                   &data_type, &size, &digits, &nullable);
    EXPECT_EQ(ret, SQL_ERROR);
    EXPECT_EQ(Sqlstate(SQL_HANDLE_STMT, hstmt), "HY000");
}

TEST_F(ErrorInjectionTest, FailOnSQLColumns) {
    ConnectWithConfig("Mode=Partial;FailOn=SQLColumns;ErrorCode=HY000");

    SQLRETURN ret = SQLColumns(hstmt, nullptr, 0, nullptr, 0,
                               reinterpret_cast<SQLCHAR*>(const_cast<char*>("USERS")), SQL_NTS,
                               nullptr, 0);
    EXPECT_EQ(ret, SQL_ERROR);
    EXPECT_EQ(Sqlstate(SQL_HANDLE_STMT, hstmt), "HY000");

    // Other catalog functions are untouched
    ret = SQLTables(hstmt, nullptr, 0, nullptr, 0, nullptr, 0, nullptr, 0);
    EXPECT_EQ(ret, SQL_SUCCESS);
}

TEST_F(ErrorInjectionTest, FailOnSQLDriverConnect) {
    std::string conn_str = "Driver={Mock ODBC Driver};Mode=Partial;FailOn=SQLDriverConnect;ErrorCode=28000";
    SQLRETURN ret = SQLDriverConnect(hdbc, nullptr,
                                     reinterpret_cast<SQLCHAR*>(const_cast<char*>(conn_str.c_str())),
                                     SQL_NTS, nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT);
    EXPECT_EQ(ret, SQL_ERROR);
    EXPECT_EQ(Sqlstate(SQL_HANDLE_DBC, hdbc), "28000");
}

TEST_F(ErrorInjectionTest, FailOnIsCaseInsensitive) {
    ConnectWithConfig("Mode=Partial;FailOn=sqlnumparams;ErrorCode=HY000");

    ASSERT_EQ(Prepare("SELECT USER_ID FROM USERS WHERE USER_ID = ?"), SQL_SUCCESS);

    SQLSMALLINT num_params = 0;
    EXPECT_EQ(SQLNumParams(hstmt, &num_params), SQL_ERROR);
}

TEST_F(ErrorInjectionTest, ModeSuccess) {
    ConnectWithConfig("Mode=Success");

    EXPECT_EQ(Prepare("SELECT USER_ID FROM USERS"), SQL_SUCCESS);
    EXPECT_EQ(SQLExecute(hstmt), SQL_SUCCESS);
}

TEST_F(ErrorInjectionTest, UnknownTableReports42S02) {
    ConnectWithConfig("Mode=Success");

    SQLRETURN ret = Prepare("SELECT * FROM NO_SUCH_TABLE");
    EXPECT_EQ(ret, SQL_ERROR);
    EXPECT_EQ(Sqlstate(SQL_HANDLE_STMT, hstmt), "42S02");
    EXPECT_NE(last_message.find("NO_SUCH_TABLE"), std::string::npos);
}

TEST_F(ErrorInjectionTest, UnknownColumnReports42S22) {
    ConnectWithConfig("Mode=Success");

    EXPECT_EQ(Prepare("SELECT NOPE FROM USERS"), SQL_ERROR);
    EXPECT_EQ(Sqlstate(SQL_HANDLE_STMT, hstmt), "42S22");
}

TEST_F(ErrorInjectionTest, SyntaxErrorReports42000) {
    ConnectWithConfig("Mode=Success");

    EXPECT_EQ(Prepare("SELEC 1"), SQL_ERROR);
    EXPECT_EQ(Sqlstate(SQL_HANDLE_STMT, hstmt), "42000");
}

TEST_F(ErrorInjectionTest, ExecuteWithoutPrepare) {
    ConnectWithConfig("Mode=Success");

    EXPECT_EQ(SQLExecute(hstmt), SQL_ERROR);
    EXPECT_EQ(Sqlstate(SQL_HANDLE_STMT, hstmt), "HY010");
}
