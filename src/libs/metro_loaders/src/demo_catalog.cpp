#include <metro_loaders/demo_catalog.hpp>
#include <initializer_list>
#include <utility>

namespace metro_loaders {

metro_model::StationSet generate_demo_stations() {
    using L = metro_model::LineId;
    using S = metro_model::Significance;

    metro_model::StationSet out;
    out.name = "Twelve thousand years of civilization (built-in)";

    auto add = [&](const char* id, int year, std::initializer_list<L> lines, S significance,
                   const char* name, const char* year_label) {
        metro_model::Station st;
        st.id = id;
        st.year = year;
        st.lines.assign(lines.begin(), lines.end());
        st.significance = significance;
        st.name = name;
        st.year_label = year_label;
        out.stations.push_back(std::move(st));
    };

    add("neolithic", -10000, { L::Tech, L::Population }, S::Major, "The Neolithic Junction", "10,000 BCE");
    add("pottery", -8000, { L::Tech }, S::Minor, "Pottery & Ceramics", "8,000 BCE");
    add("copper", -6000, { L::Tech }, S::Minor, "Copper Age", "6,000 BCE");
    add("agriculture-spread", -5000, { L::Population, L::Tech }, S::Major, "Agricultural Revolution", "5,000 BCE");
    add("mesopotamia", -4000, { L::Empire, L::Population }, S::Major, "Mesopotamian Cities", "4,000 BCE");
    add("uruk", -3500, { L::Tech, L::Empire, L::Population }, S::Hub, "Uruk Central", "3,500 BCE");
    add("indus", -3300, { L::Empire, L::Tech }, S::Major, "Indus Valley", "3,300 BCE");
    add("wheel", -3200, { L::Tech }, S::Major, "The Wheel", "3,200 BCE");
    add("egypt", -3100, { L::Empire, L::Tech }, S::Major, "Ancient Egypt", "3,100 BCE");
    add("bronze", -3000, { L::Tech, L::War }, S::Major, "Bronze Age", "3,000 BCE");
    add("pyramids", -2600, { L::Empire, L::Tech }, S::Major, "Great Pyramids", "2,600 BCE");
    add("code-hammurabi", -1750, { L::Philosophy, L::Empire }, S::Major, "Hammurabi's Code", "1,750 BCE");
    add("iron", -1200, { L::Tech, L::War }, S::Major, "Iron Age", "1,200 BCE");
    add("olympics", -776, { L::Philosophy, L::Population }, S::Minor, "First Olympics", "776 BCE");
    add("buddha", -563, { L::Philosophy }, S::Major, "Buddha & Philosophy", "563 BCE");
    add("confucius", -551, { L::Philosophy, L::Empire }, S::Major, "Confucius", "551 BCE");
    add("persian", -550, { L::Empire }, S::Major, "Persian Empire", "550 BCE");
    add("rome", -509, { L::Empire, L::Philosophy }, S::Major, "Roman Republic", "509 BCE");
    add("classical", -500, { L::Empire, L::Philosophy }, S::Hub, "Classical Era", "500 BCE");
    add("alexander", -336, { L::Empire, L::Philosophy }, S::Major, "Alexander the Great", "336 BCE");
    add("qin", -221, { L::Empire, L::Tech }, S::Major, "Qin Dynasty", "221 BCE");
    add("jesus", 0, { L::Philosophy }, S::Major, "Jesus & Christianity", "1 CE");
    add("han", 100, { L::Empire, L::Tech }, S::Major, "Han Dynasty Peak", "100 CE");
    add("pax-romana", 117, { L::Empire, L::Tech }, S::Major, "Pax Romana", "117 CE");
    add("fall-rome", 476, { L::War, L::Empire }, S::Major, "Fall of Rome", "476 CE");
    add("justinian", 529, { L::Philosophy, L::Empire }, S::Minor, "Justinian Code", "529 CE");
    add("tang", 618, { L::Empire, L::Philosophy }, S::Major, "Tang Dynasty", "618 CE");
    add("vikings", 793, { L::War, L::Tech }, S::Major, "Viking Age", "793 CE");
    add("islamic-golden", 800, { L::Tech, L::Philosophy }, S::Major, "Islamic Golden Age", "800 CE");
    add("gunpowder", 850, { L::Tech, L::War }, S::Major, "Gunpowder", "850 CE");
    add("crusades", 1095, { L::War, L::Philosophy, L::Empire }, S::Major, "The Crusades", "1095 CE");
    add("mongol", 1206, { L::Empire, L::War }, S::Major, "Mongol Empire", "1206 CE");
    add("magna-carta", 1215, { L::Philosophy, L::Empire }, S::Major, "Magna Carta", "1215 CE");
    add("mali-empire", 1324, { L::Empire, L::Tech }, S::Minor, "Mali Empire", "1324 CE");
    add("black-death", 1347, { L::Population, L::War }, S::Crisis, "Black Death", "1347 CE");
    add("renaissance", 1400, { L::Philosophy, L::Tech }, S::Major, "Renaissance", "1400 CE");
    add("printing", 1440, { L::Tech, L::Philosophy }, S::Major, "Printing Press", "1440 CE");
    add("gutenberg", 1455, { L::Tech, L::Philosophy }, S::Major, "Gutenberg Bible", "1455 CE");
    add("columbian", 1492, { L::Empire, L::Population, L::Tech }, S::Hub, "Columbian Exchange Terminal", "1492 CE");
    add("reformation", 1517, { L::Philosophy, L::War }, S::Major, "The Reformation", "1517 CE");
    add("scientific-rev", 1543, { L::Tech, L::Philosophy }, S::Major, "Scientific Revolution", "1543 CE");
    add("enlightenment", 1687, { L::Philosophy, L::Tech }, S::Major, "Enlightenment", "1687 CE");
    add("steam", 1712, { L::Tech }, S::Major, "Steam Engine", "1712 CE");
    add("watt", 1769, { L::Tech }, S::Major, "Watt's Engine", "1769 CE");
    add("french-rev", 1789, { L::War, L::Philosophy, L::Empire }, S::Major, "French Revolution", "1789 CE");
    add("industrial", 1800, { L::Tech, L::Population, L::Philosophy }, S::Hub, "Industrial Grand Central", "1800 CE");
    add("railroad", 1825, { L::Tech }, S::Major, "Railroads", "1825 CE");
    add("telegraph", 1844, { L::Tech }, S::Major, "Telegraph", "1844 CE");
    add("communist-manifesto", 1848, { L::Philosophy, L::Empire }, S::Major, "Marx & Labor", "1848 CE");
    add("darwin", 1859, { L::Philosophy, L::Tech }, S::Major, "Origin of Species", "1859 CE");
    add("electricity", 1879, { L::Tech }, S::Major, "The Electric Spark", "1879 CE");
    add("germ-theory", 1880, { L::Tech, L::Population }, S::Major, "Germ Theory", "1880 CE");
    add("flight", 1903, { L::Tech }, S::Major, "Aviation", "1903 CE");
    add("ww1", 1914, { L::War, L::Tech }, S::Crisis, "World War I", "1914 CE");
    add("suffrage", 1920, { L::Philosophy, L::Population }, S::Major, "Women's Suffrage", "1920 CE");
    add("penicillin", 1928, { L::Tech, L::Population }, S::Major, "Penicillin", "1928 CE");
    add("crisis", 1914, { L::War, L::Tech, L::Empire, L::Philosophy }, S::Crisis, "The Crisis Hub", "1914–1945");
    add("atomic", 1945, { L::Tech, L::War }, S::Crisis, "The Atomic Station", "1945 CE");
    add("transistor", 1947, { L::Tech }, S::Major, "The Transistor", "1947 CE");
    add("dna", 1953, { L::Tech, L::Philosophy }, S::Major, "DNA Structure", "1953 CE");
    add("space", 1957, { L::Tech }, S::Major, "Space Age", "1957 CE");
    add("moon-landing", 1969, { L::Tech, L::Empire, L::Philosophy }, S::Major, "Apollo 11", "1969 CE");
    add("internet", 1969, { L::Tech }, S::Major, "ARPANET", "1969 CE");
    add("pc", 1977, { L::Tech }, S::Major, "Personal Computer", "1977 CE");
    add("berlin-wall-fall", 1989, { L::Empire, L::Philosophy }, S::Major, "Fall of the Wall", "1989 CE");
    add("web", 1991, { L::Tech }, S::Major, "The Web", "1991 CE");
    add("human-genome", 2003, { L::Tech, L::Philosophy }, S::Major, "Human Genome", "2003 CE");
    add("smartphone", 2007, { L::Tech, L::Population }, S::Major, "Smartphone", "2007 CE");
    add("social-media", 2010, { L::Tech, L::Philosophy, L::Population }, S::Minor, "Social Network", "2010 CE");
    add("crypto-ai-start", 2017, { L::Tech, L::Empire }, S::Minor, "Decentralization & AI", "2017 CE");
    add("singularity", 2025, { L::Tech, L::Population, L::Philosophy, L::Empire }, S::Current, "Digital Singularity / AGI", "2025 CE");

    return out;
}

} // namespace metro_loaders
