#include "generation.hpp"

#include <algorithm>
#include <cstdio>

const std::vector<generation::MerchantTemplate>& generation::merchants()
{
    // Chilean retail prices in CLP
    static const std::vector<MerchantTemplate> table {
        {
            "Cencosud Retail S.A.", "Jumbo", "Supermarket",
            {
                { "Leche Entera 1L", "Dairy & Eggs", "Milk", 1290, 1690, 6 },
                { "Pan Molde Integral", "Bakery", "Bread", 1990, 2990 },
                { "Huevos Docena", "Dairy & Eggs", "Eggs", 3490, 4990 },
                { "Pechuga de Pollo Kg", "Meat & Seafood", "Poultry", 5990, 7990, 2 },
                { "Arroz Grado 1 Kg", "Pantry", "Grains", 1490, 2290, 2 },
                { "Palta Hass Kg", "Produce", "Fruit", 4990, 8990 },
                { "Detergente Líquido 3L", "Cleaning Supplies", "Laundry", 5990, 8990 },
                { "Café Molido 250g", "Beverages", "Coffee", 3990, 6990 },
                { "Vino Tinto 750ml", "Alcohol", "Wine", 3990, 12990, 3 }
            }
        },
        {
            "Walmart Chile S.A.", "Líder", "Supermarket",
            {
                { "Leche Descremada 1L", "Dairy & Eggs", "Milk", 1190, 1590, 6 },
                { "Pan de Molde Blanco", "Bakery", "Bread", 1690, 2490 },
                { "Asado Carnicero Kg", "Meat & Seafood", "Beef", 7990, 11990 },
                { "Tallarines 500g", "Pantry", "Pasta", 790, 1290, 4 },
                { "Cebolla Kg", "Produce", "Vegetables", 890, 1490 },
                { "Lavaloza 750ml", "Cleaning Supplies", "Dishes", 1490, 2490 },
                { "Té Caja 100u", "Beverages", "Tea", 2490, 3990 }
            }
        },
        {
            "SMU S.A.", "Unimarc", "Supermarket",
            {
                { "Hallulla Pack 6", "Bakery", "Bread", 1290, 1890, 2 },
                { "Huevos 15u", "Dairy & Eggs", "Eggs", 3990, 4990 },
                { "Merluza Filete Kg", "Meat & Seafood", "Fish", 6990, 9990 },
                { "Azúcar 1Kg", "Pantry", "Baking", 1290, 1690 },
                { "Papa Kg", "Produce", "Vegetables", 890, 1490, 3 },
                { "Cloro 1L", "Cleaning Supplies", "Disinfectants", 990, 1490 }
            }
        },
        {
            "Farmacias Cruz Verde S.A.", "Cruz Verde", "Pharmacy",
            {
                { "Paracetamol 500mg", "Pharmacy", "Pain Relief", 990, 2490 },
                { "Protector Solar FPS50", "Health & Beauty", "Sun Care", 8990, 15990 },
                { "Shampoo 400ml", "Personal Care", "Hair Care", 3490, 6990 },
                { "Vitamina C 1g", "Supplements", "Vitamins", 4990, 8990 },
                { "Pañales Pack 40", "Baby Products", "Diapers", 11990, 16990 }
            }
        },
        {
            "Copec S.A.", "Copec", "Transport",
            {
                { "Bencina 95 Litro", "Automotive", "Fuel", 1290, 1490, 45 },
                { "Café Americano", "Prepared Food", "Coffee", 1990, 2990 },
                { "Lavado Auto", "Service", "Car Wash", 6990, 12990 }
            }
        },
        {
            "Sociedad Gastronómica Ltda.", "", "Restaurant",
            {
                { "Menú del Día", "Prepared Food", "Lunch", 6990, 9990, 2 },
                { "Pisco Sour", "Alcohol", "Cocktails", 4990, 6990, 3 },
                { "Propina", "Tax & Fees", "Tips", 1000, 5000 }
            }
        },
        {
            "Falabella Retail S.A.", "Falabella", "Clothing",
            {
                { "Polera Algodón", "Clothing", "Tops", 7990, 14990, 2 },
                { "Jeans", "Clothing", "Pants", 19990, 34990 },
                { "Zapatillas Running", "Sports & Outdoors", "Footwear", 39990, 69990 }
            }
        },
        {
            "Netflix International B.V.", "Netflix", "Services",
            {
                { "Suscripción Mensual", "Subscription", "Streaming", 7990, 11990 }
            }
        },
        {
            "Sodimac S.A.", "Sodimac", "Home",
            {
                { "Ampolleta LED", "Hardware", "Lighting", 1990, 3990, 4 },
                { "Tierra de Hoja 50L", "Garden", "Soil", 3990, 5990 },
                { "Alimento Perro 15Kg", "Pet Supplies", "Dog Food", 24990, 34990 }
            }
        }
    };
    return table;
}

bool generation::is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int generation::days_in_month(int year, int month)
{
    static constexpr int days[] { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month == 2 && is_leap_year(year))
        return 29;
    return days[month - 1];
}

std::string generation::random_date(int year, std::mt19937& gen)
{
    std::uniform_int_distribution<> month_dist(1, 12);
    int month = month_dist(gen);

    std::uniform_int_distribution<> day_dist(1, days_in_month(year, month));
    int day = day_dist(gen);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

models::Transaction generation::generate_transaction(int year, std::mt19937& gen)
{
    const auto& table = merchants();
    std::uniform_int_distribution<size_t> merchant_dist(0, table.size() - 1);
    const auto& merchant = table[merchant_dist(gen)];

    models::Transaction t;
    t.date = random_date(year, gen);
    t.merchant = std::string{merchant.name};
    if (!merchant.alias.empty())
        t.alias = std::string{merchant.alias};
    t.category = std::string{merchant.category};

    // Pick distinct items by shuffling the indices and keeping a prefix
    std::vector<size_t> indices(merchant.items.size());
    for (size_t i = 0; i < indices.size(); ++i)
        indices[i] = i;
    std::shuffle(indices.begin(), indices.end(), gen);

    std::uniform_int_distribution<size_t> count_dist(1, std::min<size_t>(6, indices.size()));
    indices.resize(count_dist(gen));

    double total = 0;
    for (auto index : indices)
    {
        const auto& item = merchant.items[index];

        // Whole tens of pesos
        std::uniform_int_distribution<uint32_t> price_dist(item.min_price / 10, item.max_price / 10);
        double price = price_dist(gen) * 10.0;

        std::uniform_int_distribution<uint32_t> qty_dist(1, item.max_qty);
        double qty = qty_dist(gen);

        models::LineItem line;
        line.name = std::string{item.name};
        line.price = price;
        line.qty = qty;
        line.category = std::string{item.category};
        line.subcategory = std::string{item.subcategory};
        t.items.push_back(std::move(line));

        total += price * qty;
    }

    t.total = total;
    return t;
}

models::TransactionList generation::generate_year(int year, size_t count, std::mt19937& gen)
{
    models::TransactionList transactions;
    transactions.reserve(count);
    for (size_t i = 0; i < count; ++i)
        transactions.push_back(generate_transaction(year, gen));

    std::stable_sort(transactions.begin(), transactions.end(), [](const models::Transaction& a, const models::Transaction& b) {
        return a.date < b.date;
    });

    for (size_t i = 0; i < transactions.size(); ++i)
        transactions[i].id = "tx-" + std::to_string(year) + "-" + std::to_string(i + 1);

    return transactions;
}
