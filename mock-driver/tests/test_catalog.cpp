// Catalog function tests: SQLTables, SQLColumns, SQLFetch and SQLGetData
#include <gtest/gtest.h>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>
#include <string>
#include <vector>

class CatalogTest : public ::testing::Test {
protected:
    SQLHENV henv = SQL_NULL_HENV;
    SQLHDBC hdbc = SQL_NULL_HDBC;
    SQLHSTMT hstmt = SQL_NULL_HSTMT;

    void SetUp() override {
        ASSERT_EQ(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &henv), SQL_SUCCESS);
        ASSERT_EQ(SQLSetEnvAttr(henv, SQL_ATTR_ODBC_VERSION,
                                reinterpret_cast<SQLPOINTER>(static_cast<intptr_t>(SQL_OV_ODBC3)), 0),
                  SQL_SUCCESS);
        ASSERT_EQ(SQLAllocHandle(SQL_HANDLE_DBC, henv, &hdbc), SQL_SUCCESS);
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

    void Connect(const std::string& options = "") {
        std::string conn_str = "Driver={Mock ODBC Driver};" + options;
        SQLRETURN ret = SQLDriverConnect(hdbc, nullptr,
                                         reinterpret_cast<SQLCHAR*>(const_cast<char*>(conn_str.c_str())),
                                         SQL_NTS, nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT);
        ASSERT_EQ(ret, SQL_SUCCESS);
        ASSERT_EQ(SQLAllocHandle(SQL_HANDLE_STMT, hdbc, &hstmt), SQL_SUCCESS);
    }

    SQLRETURN Columns(const char* table, const char* column = nullptr) {
        return SQLColumns(hstmt, nullptr, 0, nullptr, 0,
                          reinterpret_cast<SQLCHAR*>(const_cast<char*>(table)), SQL_NTS,
                          reinterpret_cast<SQLCHAR*>(const_cast<char*>(column)), column ? SQL_NTS : 0);
    }

    std::string GetString(SQLUSMALLINT col) {
        SQLCHAR buffer[256] = {0};
        SQLLEN indicator = 0;
        EXPECT_EQ(SQLGetData(hstmt, col, SQL_C_CHAR, buffer, sizeof(buffer), &indicator), SQL_SUCCESS);
        if (indicator == SQL_NULL_DATA) return "<null>";
        return reinterpret_cast<char*>(buffer);
    }

    SQLSMALLINT GetSmallint(SQLUSMALLINT col) {
        SQLSMALLINT value = -1;
        SQLLEN indicator = 0;
        EXPECT_EQ(SQLGetData(hstmt, col, SQL_C_SSHORT, &value, sizeof(value), &indicator), SQL_SUCCESS);
        return value;
    }

    std::string Sqlstate() {
        SQLCHAR sqlstate[6] = {0};
        SQLGetDiagRec(SQL_HANDLE_STMT, hstmt, 1, sqlstate, nullptr, nullptr, 0, nullptr);
        return reinterpret_cast<char*>(sqlstate);
    }
};

TEST_F(CatalogTest, TablesListsCatalog) {
    Connect();
    ASSERT_EQ(SQLTables(hstmt, nullptr, 0, nullptr, 0, nullptr, 0, nullptr, 0), SQL_SUCCESS);

    SQLSMALLINT cols = 0;
    ASSERT_EQ(SQLNumResultCols(hstmt, &cols), SQL_SUCCESS);
    EXPECT_EQ(cols, 5);

    std::vector<std::string> names;
    while (SQLFetch(hstmt) == SQL_SUCCESS) {
        names.push_back(GetString(3));
        EXPECT_EQ(GetString(4), "TABLE");
    }
    EXPECT_EQ(names, (std::vector<std::string>{"USERS", "ORDERS", "PRODUCTS", "ORDER_ITEMS"}));
}

TEST_F(CatalogTest, TablesPatternAndType) {
    Connect();
    ASSERT_EQ(SQLTables(hstmt, nullptr, 0, nullptr, 0,
                        reinterpret_cast<SQLCHAR*>(const_cast<char*>("ORDER%")), SQL_NTS,
                        reinterpret_cast<SQLCHAR*>(const_cast<char*>("'TABLE'")), SQL_NTS),
              SQL_SUCCESS);

    int rows = 0;
    while (SQLFetch(hstmt) == SQL_SUCCESS) ++rows;
    EXPECT_EQ(rows, 2);

    ASSERT_EQ(SQLTables(hstmt, nullptr, 0, nullptr, 0, nullptr, 0,
                        reinterpret_cast<SQLCHAR*>(const_cast<char*>("VIEW")), SQL_NTS),
              SQL_SUCCESS);
    EXPECT_EQ(SQLFetch(hstmt), SQL_NO_DATA);
}

TEST_F(CatalogTest, ColumnsForOneTable) {
    Connect();
    ASSERT_EQ(Columns("USERS"), SQL_SUCCESS);

    SQLSMALLINT cols = 0;
    ASSERT_EQ(SQLNumResultCols(hstmt, &cols), SQL_SUCCESS);
    EXPECT_EQ(cols, 18);

    ASSERT_EQ(SQLFetch(hstmt), SQL_SUCCESS);
    EXPECT_EQ(GetString(1), "<null>");
    EXPECT_EQ(GetString(3), "USERS");
    EXPECT_EQ(GetString(4), "USER_ID");
    EXPECT_EQ(GetSmallint(5), SQL_INTEGER);
    EXPECT_EQ(GetString(6), "INTEGER");
    EXPECT_EQ(GetSmallint(11), SQL_NO_NULLS);
    EXPECT_EQ(GetString(17), "1");
    EXPECT_EQ(GetString(18), "NO");

    ASSERT_EQ(SQLFetch(hstmt), SQL_SUCCESS);
    EXPECT_EQ(GetString(4), "USERNAME");

    ASSERT_EQ(SQLFetch(hstmt), SQL_SUCCESS);
    EXPECT_EQ(GetString(4), "EMAIL");
    EXPECT_EQ(GetSmallint(11), SQL_NULLABLE);
    EXPECT_EQ(GetString(18), "YES");

    int remaining = 0;
    while (SQLFetch(hstmt) == SQL_SUCCESS) ++remaining;
    EXPECT_EQ(remaining, 5);
}

TEST_F(CatalogTest, ColumnsDatetimeSplit) {
    Connect();
    ASSERT_EQ(Columns("ORDERS", "ORDER_DATE"), SQL_SUCCESS);
    ASSERT_EQ(SQLFetch(hstmt), SQL_SUCCESS);

    EXPECT_EQ(GetSmallint(5), SQL_TYPE_TIMESTAMP);
    EXPECT_EQ(GetSmallint(14), SQL_DATETIME);
    EXPECT_EQ(GetSmallint(15), SQL_CODE_TIMESTAMP);
    EXPECT_EQ(SQLFetch(hstmt), SQL_NO_DATA);
}

TEST_F(CatalogTest, ColumnsUnknownTableIsEmpty) {
    Connect();
    ASSERT_EQ(Columns("NOPE"), SQL_SUCCESS);
    EXPECT_EQ(SQLFetch(hstmt), SQL_NO_DATA);
}

TEST_F(CatalogTest, EmptyCatalogHasNoColumns) {
    Connect("Catalog=Empty;");
    ASSERT_EQ(Columns("USERS"), SQL_SUCCESS);
    EXPECT_EQ(SQLFetch(hstmt), SQL_NO_DATA);
}

TEST_F(CatalogTest, GetDataPiecewise) {
    Connect();
    ASSERT_EQ(Columns("ORDER_ITEMS", "ORDER_ITEM_ID"), SQL_SUCCESS);
    ASSERT_EQ(SQLFetch(hstmt), SQL_SUCCESS);

    SQLCHAR buffer[6] = {0};
    SQLLEN indicator = 0;
    ASSERT_EQ(SQLGetData(hstmt, 4, SQL_C_CHAR, buffer, sizeof(buffer), &indicator),
              SQL_SUCCESS_WITH_INFO);
    EXPECT_STREQ(reinterpret_cast<char*>(buffer), "ORDER");
    EXPECT_EQ(indicator, 13);
    EXPECT_EQ(Sqlstate(), "01004");

    ASSERT_EQ(SQLGetData(hstmt, 4, SQL_C_CHAR, buffer, sizeof(buffer), &indicator),
              SQL_SUCCESS_WITH_INFO);
    EXPECT_STREQ(reinterpret_cast<char*>(buffer), "_ITEM");
    EXPECT_EQ(indicator, 8);

    ASSERT_EQ(SQLGetData(hstmt, 4, SQL_C_CHAR, buffer, sizeof(buffer), &indicator), SQL_SUCCESS);
    EXPECT_STREQ(reinterpret_cast<char*>(buffer), "_ID");
    EXPECT_EQ(indicator, 3);

    EXPECT_EQ(SQLGetData(hstmt, 4, SQL_C_CHAR, buffer, sizeof(buffer), &indicator), SQL_NO_DATA);
}

TEST_F(CatalogTest, GetDataNullNeedsIndicator) {
    Connect();
    ASSERT_EQ(Columns("USERS", "USER_ID"), SQL_SUCCESS);
    ASSERT_EQ(SQLFetch(hstmt), SQL_SUCCESS);

    SQLCHAR buffer[16] = {0};
    EXPECT_EQ(SQLGetData(hstmt, 1, SQL_C_CHAR, buffer, sizeof(buffer), nullptr), SQL_ERROR);
    EXPECT_EQ(Sqlstate(), "22002");
}

TEST_F(CatalogTest, GetDataBeforeFetch) {
    Connect();
    ASSERT_EQ(Columns("USERS"), SQL_SUCCESS);

    SQLCHAR buffer[16] = {0};
    SQLLEN indicator = 0;
    EXPECT_EQ(SQLGetData(hstmt, 3, SQL_C_CHAR, buffer, sizeof(buffer), &indicator), SQL_ERROR);
    EXPECT_EQ(Sqlstate(), "24000");
}

TEST_F(CatalogTest, GetDataInvalidColumn) {
    Connect();
    ASSERT_EQ(Columns("USERS"), SQL_SUCCESS);
    ASSERT_EQ(SQLFetch(hstmt), SQL_SUCCESS);

    SQLCHAR buffer[16] = {0};
    SQLLEN indicator = 0;
    EXPECT_EQ(SQLGetData(hstmt, 19, SQL_C_CHAR, buffer, sizeof(buffer), &indicator), SQL_ERROR);
    EXPECT_EQ(Sqlstate(), "07009");
}

TEST_F(CatalogTest, CatalogResultDescribesItself) {
    Connect();
    ASSERT_EQ(Columns("USERS"), SQL_SUCCESS);

    SQLCHAR name[32] = {0};
    SQLSMALLINT len = 0, type = 0, nullable = 0;
    ASSERT_EQ(SQLDescribeCol(hstmt, 11, name, sizeof(name), &len, &type, nullptr, nullptr, &nullable),
              SQL_SUCCESS);
    EXPECT_STREQ(reinterpret_cast<char*>(name), "NULLABLE");
    EXPECT_EQ(type, SQL_SMALLINT);
    EXPECT_EQ(nullable, SQL_NO_NULLS);
}
