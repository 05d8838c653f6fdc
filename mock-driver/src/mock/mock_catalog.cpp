#include "mock_catalog.hpp"
#include "../utils/string_utils.hpp"

namespace mock_odbc {

const MockColumn* MockTable::find_column(const std::string& column_name) const {
    std::string upper_name = to_upper(column_name);
    for (const auto& col : columns) {
        if (to_upper(col.name) == upper_name) {
            return &col;
        }
    }
    return nullptr;
}

const MockCatalog& MockCatalog::preset(const std::string& name) {
    static const MockCatalog default_catalog = create_default_catalog();
    static const MockCatalog empty_catalog;
    
    if (to_lower(name) == "empty") {
        return empty_catalog;
    }
    return default_catalog;
}

MockCatalog MockCatalog::create_default_catalog() {
    MockCatalog catalog;
    
    // USERS table
    MockTable users;
    users.name = "USERS";
    users.type = "TABLE";
    users.remarks = "User accounts";
    users.columns = {
        {"USER_ID", SQL_INTEGER, "INTEGER", 10, 0, SQL_NO_NULLS},
        {"USERNAME", SQL_VARCHAR, "VARCHAR", 50, 0, SQL_NO_NULLS},
        {"EMAIL", SQL_VARCHAR, "VARCHAR", 100, 0, SQL_NULLABLE},
        {"CREATED_DATE", SQL_TYPE_DATE, "DATE", 10, 0, SQL_NULLABLE},
        {"IS_ACTIVE", SQL_BIT, "BIT", 1, 0, SQL_NULLABLE},
        {"BALANCE", SQL_DECIMAL, "DECIMAL", 10, 2, SQL_NULLABLE},
        {"EXTERNAL_ID", SQL_GUID, "UUID", 36, 0, SQL_NULLABLE},
        {"LOGIN_COUNT", SQL_INTEGER, "INTEGER UNSIGNED", 10, 0, SQL_NO_NULLS, true}
    };
    catalog.tables_.push_back(users);
    
    // ORDERS table
    MockTable orders;
    orders.name = "ORDERS";
    orders.type = "TABLE";
    orders.remarks = "Order records";
    orders.columns = {
        {"ORDER_ID", SQL_INTEGER, "INTEGER", 10, 0, SQL_NO_NULLS},
        {"USER_ID", SQL_INTEGER, "INTEGER", 10, 0, SQL_NO_NULLS},
        {"ORDER_DATE", SQL_TYPE_TIMESTAMP, "TIMESTAMP", 26, 6, SQL_NULLABLE},
        {"TOTAL_AMOUNT", SQL_DECIMAL, "DECIMAL", 10, 2, SQL_NULLABLE},
        {"STATUS", SQL_VARCHAR, "VARCHAR", 20, 0, SQL_NULLABLE}
    };
    catalog.tables_.push_back(orders);
    
    // PRODUCTS table
    MockTable products;
    products.name = "PRODUCTS";
    products.type = "TABLE";
    products.remarks = "Product catalog";
    products.columns = {
        {"PRODUCT_ID", SQL_INTEGER, "INTEGER", 10, 0, SQL_NO_NULLS},
        {"NAME", SQL_VARCHAR, "VARCHAR", 100, 0, SQL_NO_NULLS},
        {"DESCRIPTION", SQL_LONGVARCHAR, "TEXT", 65535, 0, SQL_NULLABLE},
        {"PRICE", SQL_DECIMAL, "DECIMAL", 10, 2, SQL_NULLABLE},
        {"STOCK_QUANTITY", SQL_INTEGER, "INTEGER", 10, 0, SQL_NULLABLE},
        {"CATEGORY", SQL_VARCHAR, "VARCHAR", 50, 0, SQL_NULLABLE},
        {"SHELF_LIFE", SQL_INTERVAL_DAY_TO_SECOND, "INTERVAL DAY TO SECOND", 25, 6, SQL_NULLABLE}
    };
    catalog.tables_.push_back(products);
    
    // ORDER_ITEMS table
    MockTable order_items;
    order_items.name = "ORDER_ITEMS";
    order_items.type = "TABLE";
    order_items.remarks = "Order line items";
    order_items.columns = {
        {"ORDER_ITEM_ID", SQL_INTEGER, "INTEGER", 10, 0, SQL_NO_NULLS},
        {"ORDER_ID", SQL_INTEGER, "INTEGER", 10, 0, SQL_NO_NULLS},
        {"PRODUCT_ID", SQL_INTEGER, "INTEGER", 10, 0, SQL_NO_NULLS},
        {"QUANTITY", SQL_INTEGER, "INTEGER", 10, 0, SQL_NULLABLE},
        {"UNIT_PRICE", SQL_DECIMAL, "DECIMAL", 10, 2, SQL_NULLABLE}
    };
    catalog.tables_.push_back(order_items);
    
    return catalog;
}

const MockTable* MockCatalog::find_table(const std::string& name) const {
    std::string upper_name = to_upper(name);
    for (const auto& table : tables_) {
        if (to_upper(table.name) == upper_name) {
            return &table;
        }
    }
    return nullptr;
}

bool MockCatalog::matches_pattern(const std::string& value, const std::string& pattern) {
    if (pattern.empty() || pattern == "%") return true;
    
    std::string upper_value = to_upper(value);
    std::string upper_pattern = to_upper(pattern);
    
    size_t v = 0, p = 0;
    size_t vlen = upper_value.length();
    size_t plen = upper_pattern.length();
    
    while (v < vlen && p < plen) {
        if (upper_pattern[p] == '%') {
            // Skip consecutive %
            while (p < plen && upper_pattern[p] == '%') ++p;
            if (p >= plen) return true;  // Trailing %
            
            std::string rest = upper_pattern.substr(p);
            for (; v < vlen; ++v) {
                if (matches_pattern(upper_value.substr(v), rest)) {
                    return true;
                }
            }
            return false;
        } else if (upper_pattern[p] == '_' || upper_pattern[p] == upper_value[v]) {
            ++v;
            ++p;
        } else {
            return false;
        }
    }
    
    // Handle trailing %
    while (p < plen && upper_pattern[p] == '%') ++p;
    
    return v == vlen && p == plen;
}

} // namespace mock_odbc
