#include "exports.hpp"

#include <unordered_map>

namespace exports
{
    namespace
    {
        const std::unordered_map<std::string_view, std::string_view>& spanish_item_categories()
        {
            static const std::unordered_map<std::string_view, std::string_view> table {
                // Fresh food
                { "Produce", "Frutas y Verduras" },
                { "Meat & Seafood", "Carnes y Mariscos" },
                { "Bakery", "Panadería" },
                { "Dairy & Eggs", "Lácteos y Huevos" },
                // Packaged food
                { "Pantry", "Despensa" },
                { "Frozen Foods", "Congelados" },
                { "Snacks", "Snacks" },
                { "Beverages", "Bebidas" },
                { "Alcohol", "Alcohol" },
                // Prepared food
                { "Prepared Food", "Comida Preparada" },
                { "Fresh Food", "Comida Fresca" },
                // Health and personal
                { "Health & Beauty", "Salud y Belleza" },
                { "Personal Care", "Cuidado Personal" },
                { "Pharmacy", "Farmacia" },
                { "Supplements", "Suplementos" },
                { "Baby Products", "Productos de Bebé" },
                // Household
                { "Cleaning Supplies", "Limpieza" },
                { "Household", "Hogar" },
                { "Pet Supplies", "Mascotas" },
                // Non-food retail
                { "Clothing", "Ropa" },
                { "Electronics", "Electrónica" },
                { "Hardware", "Ferretería" },
                { "Garden", "Jardín" },
                { "Automotive", "Automotriz" },
                { "Sports & Outdoors", "Deportes" },
                { "Toys & Games", "Juguetes" },
                { "Books & Media", "Libros y Medios" },
                { "Office & Stationery", "Oficina" },
                { "Crafts & Hobbies", "Manualidades" },
                { "Furniture", "Muebles" },
                { "Musical Instruments", "Instrumentos Musicales" },
                // Services and fees
                { "Service", "Servicio" },
                { "Tax & Fees", "Impuestos y Cargos" },
                { "Subscription", "Suscripción" },
                { "Insurance", "Seguro" },
                { "Loan Payment", "Pago de Préstamo" },
                { "Tickets & Events", "Entradas y Eventos" },
                // Vices
                { "Tobacco", "Tabaco" },
                { "Gambling", "Juegos de Azar" },
                { "Other", "Otro" }
            };
            return table;
        }
    }

    std::string_view translate_item_category(std::string_view category, Language lang)
    {
        if (lang != Language::Spanish)
            return category;

        const auto& table = spanish_item_categories();
        auto it = table.find(category);
        return it != table.end() ? it->second : category;
    }
}
