#include "wits/symbols/catalog.hpp"

#include <iterator>

namespace wits::symbols {

namespace {

using enum DataType;
using enum units::Unit;

// WITS Level 0 通道定義，依 code 升冪排列
// 每個 record 的 XX01-XX07 為共用表頭
constexpr Symbol kSymbols[] = {
    // Record 1: General Time-Based
    {"0101", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0102", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0103", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0104", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0105", "DATE", "Date", Long, Unitless, Unitless},
    {"0106", "TIME", "Time", Long, Unitless, Unitless},
    {"0107", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0108", "DBTM", "Depth Bit (meas)", Float, Meters, Feet},
    {"0109", "DBTV", "Depth Bit (vert)", Float, Meters, Feet},
    {"0110", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"0111", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"0112", "BPOS", "Block Position", Float, Meters, Feet},
    {"0113", "ROPA", "Rate of Penetration (avg)", Float,
     MetersPerHour, FeetPerHour},
    {"0114", "HKLA", "Hookload (avg)", Float, KiloDecanewtons, KiloPounds},
    {"0115", "HKLX", "Hookload (max)", Float, KiloDecanewtons, KiloPounds},
    {"0116", "WOBA", "Weight-on-Bit (surf,avg)", Float,
     KiloDecanewtons, KiloPounds},
    {"0117", "WOBX", "Weight-on-Bit (surf,max)", Float,
     KiloDecanewtons, KiloPounds},
    {"0118", "TQA", "Rotary Torque (surf,avg)", Float,
     KilonewtonMeters, KiloFootPounds},
    {"0119", "TQX", "Rotary Torque (surf,max)", Float,
     KilonewtonMeters, KiloFootPounds},
    {"0120", "RPMA", "Rotary Speed (surf,avg)", Float,
     RevolutionsPerMinute, RevolutionsPerMinute},
    {"0121", "SPPA", "Standpipe Pressure (avg)", Float, Kilopascals, Psi},
    {"0122", "CHKP", "Casing (Choke) Pressure", Float, Kilopascals, Psi},
    {"0123", "SPM1", "Pump Stroke Rate #1", Float,
     StrokesPerMinute, StrokesPerMinute},
    {"0124", "SPM2", "Pump Stroke Rate #2", Float,
     StrokesPerMinute, StrokesPerMinute},
    {"0125", "SPM3", "Pump Stroke Rate #3", Float,
     StrokesPerMinute, StrokesPerMinute},
    {"0126", "TVA", "Tank Volume (active)", Float, CubicMeters, Barrels},
    {"0127", "TVCA", "Tank Volume Change (active)", Float,
     CubicMeters, Barrels},
    {"0128", "MFOP", "Mud Flow Out %", Float, Percent, Percent},
    {"0129", "MFOA", "Mud Flow Out (avg)", Float,
     LitersPerMinute, GallonsPerMinute},
    {"0130", "MFIA", "Mud Flow In (avg)", Float,
     LitersPerMinute, GallonsPerMinute},
    {"0131", "MDOA", "Mud Density Out (avg)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"0132", "MDIA", "Mud Density In (avg)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"0133", "MTOA", "Mud Temperature Out (avg)", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"0134", "MTIA", "Mud Temperature In (avg)", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"0135", "MCOA", "Mud Conductivity Out (avg)", Float,
     MillimhosPerMeter, MillimhosPerMeter},
    {"0136", "MCIA", "Mud Conductivity In (avg)", Float,
     MillimhosPerMeter, MillimhosPerMeter},
    {"0137", "STKC", "Pump Stroke Count (cum)", Long, Unitless, Unitless},
    {"0138", "LSTK", "Lag Strokes", Short, Unitless, Unitless},
    {"0139", "DRTM", "Depth Returns (meas)", Float, Meters, Feet},
    {"0140", "GASA", "Gas (avg)", Float, Percent, Percent},
    // Record 2: Drilling - Depth Based
    {"0201", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0202", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0203", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0204", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0205", "DATE", "Date", Long, Unitless, Unitless},
    {"0206", "TIME", "Time", Long, Unitless, Unitless},
    {"0207", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0208", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"0209", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"0210", "ROPA", "Rate of Penetration", Float, MetersPerHour, FeetPerHour},
    {"0211", "WOBA", "Weight-on-Bit (surf,avg)", Float,
     KiloDecanewtons, KiloPounds},
    {"0212", "HKLA", "Hookload (avg)", Float, KiloDecanewtons, KiloPounds},
    {"0213", "RPMA", "Rotary Speed (surf,avg)", Float,
     RevolutionsPerMinute, RevolutionsPerMinute},
    {"0214", "TQA", "Rotary Torque (surf,avg)", Float,
     KilonewtonMeters, KiloFootPounds},
    {"0215", "SPM1", "Pump Stroke Rate #1", Float,
     StrokesPerMinute, StrokesPerMinute},
    {"0216", "SPM2", "Pump Stroke Rate #2", Float,
     StrokesPerMinute, StrokesPerMinute},
    {"0217", "SPPA", "Standpipe Pressure (avg)", Float, Kilopascals, Psi},
    {"0218", "MFIA", "Mud Flow In (avg)", Float,
     LitersPerMinute, GallonsPerMinute},
    {"0219", "MDIA", "Mud Density In (avg)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"0220", "MTIA", "Mud Temperature In (avg)", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"0221", "GASA", "Gas (avg)", Float, Percent, Percent},
    {"0222", "DXC", "Corr. Drilling Exponent", Float, Unitless, Unitless},
    // Record 3: Drilling - Connections
    {"0301", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0302", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0303", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0304", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0305", "DATE", "Date", Long, Unitless, Unitless},
    {"0306", "TIME", "Time", Long, Unitless, Unitless},
    {"0307", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0308", "DMEA", "Depth Connection (meas)", Float, Meters, Feet},
    {"0309", "DVER", "Depth Connection (vert)", Float, Meters, Feet},
    {"0310", "TSLP", "Time In Slips", Float, Seconds, Seconds},
    {"0311", "TOBD", "Time Off Bottom", Float, Seconds, Seconds},
    {"0312", "HKLA", "Hookload (avg)", Float, KiloDecanewtons, KiloPounds},
    {"0313", "HKLX", "Hookload (max)", Float, KiloDecanewtons, KiloPounds},
    {"0314", "DRAG", "Drag (pick-up)", Float, KiloDecanewtons, KiloPounds},
    {"0315", "TQCA", "Connection Torque (avg)", Float,
     KilonewtonMeters, KiloFootPounds},
    // Record 4: Drilling - Hydraulics
    {"0401", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0402", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0403", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0404", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0405", "DATE", "Date", Long, Unitless, Unitless},
    {"0406", "TIME", "Time", Long, Unitless, Unitless},
    {"0407", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0408", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"0409", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"0410", "MFIA", "Mud Flow In (avg)", Float,
     LitersPerMinute, GallonsPerMinute},
    {"0411", "SPPA", "Standpipe Pressure (avg)", Float, Kilopascals, Psi},
    {"0412", "PBIT", "Pressure Loss (bit)", Float, Kilopascals, Psi},
    {"0413", "PANN", "Pressure Loss (annulus)", Float, Kilopascals, Psi},
    {"0414", "ECDT", "Equiv. Circ. Density (total depth)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"0415", "ECDB", "Equiv. Circ. Density (bit)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    // Record 5: Tripping - Time Based
    {"0501", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0502", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0503", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0504", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0505", "DATE", "Date", Long, Unitless, Unitless},
    {"0506", "TIME", "Time", Long, Unitless, Unitless},
    {"0507", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0508", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"0509", "DBTM", "Depth Bit (meas)", Float, Meters, Feet},
    {"0510", "BPOS", "Block Position", Float, Meters, Feet},
    {"0511", "HKLA", "Hookload (avg)", Float, KiloDecanewtons, KiloPounds},
    {"0512", "HKLX", "Hookload (max)", Float, KiloDecanewtons, KiloPounds},
    {"0513", "TVTR", "Trip Tank Volume", Float, CubicMeters, Barrels},
    {"0514", "TVTC", "Trip Tank Volume Change", Float, CubicMeters, Barrels},
    {"0515", "FILO", "Fill/Gain Volume Obs. (cum)", Float,
     CubicMeters, Barrels},
    {"0516", "FILC", "Fill/Gain Volume Calc. (cum)", Float,
     CubicMeters, Barrels},
    {"0517", "STDS", "Stands Run", Short, Unitless, Unitless},
    // Record 6: Tripping - Connections
    {"0601", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0602", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0603", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0604", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0605", "DATE", "Date", Long, Unitless, Unitless},
    {"0606", "TIME", "Time", Long, Unitless, Unitless},
    {"0607", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0608", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"0609", "DBTM", "Depth Bit (meas)", Float, Meters, Feet},
    {"0610", "STNO", "Stand Number", Short, Unitless, Unitless},
    {"0611", "TSLP", "Time In Slips", Float, Seconds, Seconds},
    {"0612", "HKLX", "Hookload (max)", Float, KiloDecanewtons, KiloPounds},
    {"0613", "DRGU", "Drag Up", Float, KiloDecanewtons, KiloPounds},
    {"0614", "DRGD", "Drag Down", Float, KiloDecanewtons, KiloPounds},
    {"0615", "DISO", "Displacement (obs)", Float, CubicMeters, Barrels},
    {"0616", "DISC", "Displacement (calc)", Float, CubicMeters, Barrels},
    // Record 7: Survey/Directional
    {"0701", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0702", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0703", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0704", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0705", "DATE", "Date", Long, Unitless, Unitless},
    {"0706", "TIME", "Time", Long, Unitless, Unitless},
    {"0707", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0708", "DMEA", "Depth Svy/reading (meas)", Float, Meters, Feet},
    {"0709", "DVER", "Depth Svy/reading (vert)", Float, Meters, Feet},
    {"0710", "PASS", "Pass Number", Short, Unitless, Unitless},
    {"0711", "SINC", "Inclination", Float, Degrees, Degrees},
    {"0712", "SAZU", "Azimuth (uncorrected)", Float, Degrees, Degrees},
    {"0713", "SAZC", "Azimuth (corrected)", Float, Degrees, Degrees},
    {"0714", "SMTF", "Magnetic Toolface", Float, Degrees, Degrees},
    {"0715", "SGTF", "Gravity Toolface", Float, Degrees, Degrees},
    {"0716", "SNS", "North-South Position", Float, Meters, Feet},
    {"0717", "SEW", "East-West Position", Float, Meters, Feet},
    {"0718", "SDLG", "Dog Leg Severity", Float,
     DegreesPer30Meters, DegreesPer100Feet},
    {"0719", "SRTY", "Survey Type", Ascii, Unitless, Unitless},
    {"0720", "SVS", "Vertical Section", Float, Meters, Feet},
    // Record 8: MWD Formation Evaluation
    {"0801", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0802", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0803", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0804", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0805", "DATE", "Date", Long, Unitless, Unitless},
    {"0806", "TIME", "Time", Long, Unitless, Unitless},
    {"0807", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0808", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"0809", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"0810", "DBTM", "Depth Bit (meas)", Float, Meters, Feet},
    {"0811", "MGRA", "Gamma Ray (avg)", Float, ApiUnits, ApiUnits},
    {"0812", "RSHA", "Resistivity (shallow)", Float, OhmMeters, OhmMeters},
    {"0813", "RMED", "Resistivity (medium)", Float, OhmMeters, OhmMeters},
    {"0814", "RDEE", "Resistivity (deep)", Float, OhmMeters, OhmMeters},
    {"0815", "NPOR", "Neutron Porosity", Float, Percent, Percent},
    {"0816", "BDEN", "Bulk Density", Float,
     KilogramsPerCubicMeter, SpecificGravity},
    {"0817", "MTMP", "Downhole Temperature", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"0818", "APWD", "Annular Pressure (dnhole)", Float, Kilopascals, Psi},
    // Record 9: MWD Mechanical
    {"0901", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"0902", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"0903", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"0904", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"0905", "DATE", "Date", Long, Unitless, Unitless},
    {"0906", "TIME", "Time", Long, Unitless, Unitless},
    {"0907", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"0908", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"0909", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"0910", "DBTM", "Depth Bit (meas)", Float, Meters, Feet},
    {"0911", "DWOB", "Weight-on-Bit (dnhole)", Float,
     KiloDecanewtons, KiloPounds},
    {"0912", "DTOR", "Torque (dnhole)", Float,
     KilonewtonMeters, KiloFootPounds},
    {"0913", "DRPM", "Rotary Speed (dnhole)", Float,
     RevolutionsPerMinute, RevolutionsPerMinute},
    {"0914", "SHKR", "Shock Count", Long, Unitless, Unitless},
    {"0915", "MTF", "Magnetic Toolface", Float, Degrees, Degrees},
    {"0916", "GTF", "Gravity Toolface", Float, Degrees, Degrees},
    {"0917", "DINC", "Inclination (dnhole)", Float, Degrees, Degrees},
    {"0918", "DAZM", "Azimuth (dnhole)", Float, Degrees, Degrees},
    // Record 10: Pressure Evaluation
    {"1001", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1002", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1003", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1004", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1005", "DATE", "Date", Long, Unitless, Unitless},
    {"1006", "TIME", "Time", Long, Unitless, Unitless},
    {"1007", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1008", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"1009", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"1010", "PPEQ", "Pore Pressure (EMW)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"1011", "FGEQ", "Fracture Gradient (EMW)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"1012", "OBEQ", "Overburden Gradient (EMW)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"1013", "DXC", "Corr. Drilling Exponent", Float, Unitless, Unitless},
    {"1014", "SIGM", "Sigmalog", Float, Unitless, Unitless},
    // Record 11: Mud Tank Volumes
    {"1101", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1102", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1103", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1104", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1105", "DATE", "Date", Long, Unitless, Unitless},
    {"1106", "TIME", "Time", Long, Unitless, Unitless},
    {"1107", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1108", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"1109", "TVT", "Tank Volume (total)", Float, CubicMeters, Barrels},
    {"1110", "TVA", "Tank Volume (active)", Float, CubicMeters, Barrels},
    {"1111", "TVCA", "Tank Volume Change (active)", Float,
     CubicMeters, Barrels},
    {"1112", "TV01", "Tank Volume 1", Float, CubicMeters, Barrels},
    {"1113", "TV02", "Tank Volume 2", Float, CubicMeters, Barrels},
    {"1114", "TV03", "Tank Volume 3", Float, CubicMeters, Barrels},
    {"1115", "TV04", "Tank Volume 4", Float, CubicMeters, Barrels},
    {"1116", "TV05", "Tank Volume 5", Float, CubicMeters, Barrels},
    {"1117", "TV06", "Tank Volume 6", Float, CubicMeters, Barrels},
    {"1118", "TTV1", "Trip Tank Volume 1", Float, CubicMeters, Barrels},
    {"1119", "TTV2", "Trip Tank Volume 2", Float, CubicMeters, Barrels},
    // Record 12: Chromatograph Cycle-Based
    {"1201", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1202", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1203", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1204", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1205", "DATE", "Date", Long, Unitless, Unitless},
    {"1206", "TIME", "Time", Long, Unitless, Unitless},
    {"1207", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1208", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"1209", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"1210", "GASA", "Gas (avg)", Float, Percent, Percent},
    {"1211", "METH", "Methane (C1)", Float, PartsPerMillion, PartsPerMillion},
    {"1212", "ETH", "Ethane (C2)", Float, PartsPerMillion, PartsPerMillion},
    {"1213", "PRP", "Propane (C3)", Float, PartsPerMillion, PartsPerMillion},
    {"1214", "IBUT", "Iso-Butane (IC4)", Float,
     PartsPerMillion, PartsPerMillion},
    {"1215", "NBUT", "Nor-Butane (NC4)", Float,
     PartsPerMillion, PartsPerMillion},
    {"1216", "IPEN", "Iso-Pentane (IC5)", Float,
     PartsPerMillion, PartsPerMillion},
    {"1217", "NPEN", "Nor-Pentane (NC5)", Float,
     PartsPerMillion, PartsPerMillion},
    {"1218", "CO2", "Carbon Dioxide", Float, Percent, Percent},
    {"1219", "H2S", "Hydrogen Sulfide", Float,
     PartsPerMillion, PartsPerMillion},
    // Record 13: Chromatograph Depth-Based
    {"1301", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1302", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1303", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1304", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1305", "DATE", "Date", Long, Unitless, Unitless},
    {"1306", "TIME", "Time", Long, Unitless, Unitless},
    {"1307", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1308", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"1309", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"1310", "GASA", "Gas (avg)", Float, Percent, Percent},
    {"1311", "METH", "Methane (C1)", Float, PartsPerMillion, PartsPerMillion},
    {"1312", "ETH", "Ethane (C2)", Float, PartsPerMillion, PartsPerMillion},
    {"1313", "PRP", "Propane (C3)", Float, PartsPerMillion, PartsPerMillion},
    {"1314", "CO2", "Carbon Dioxide", Float, Percent, Percent},
    {"1315", "H2S", "Hydrogen Sulfide", Float,
     PartsPerMillion, PartsPerMillion},
    // Record 14: Lagged Continuous Mud Properties
    {"1401", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1402", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1403", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1404", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1405", "DATE", "Date", Long, Unitless, Unitless},
    {"1406", "TIME", "Time", Long, Unitless, Unitless},
    {"1407", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1408", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"1409", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"1410", "MDOA", "Mud Density Out (avg)", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"1411", "MTOA", "Mud Temperature Out (avg)", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"1412", "MCOA", "Mud Conductivity Out (avg)", Float,
     MillimhosPerMeter, MillimhosPerMeter},
    {"1413", "MFOA", "Mud Flow Out (avg)", Float,
     LitersPerMinute, GallonsPerMinute},
    {"1414", "GASA", "Gas (avg)", Float, Percent, Percent},
    // Record 15: Cuttings/Lithology
    {"1501", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1502", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1503", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1504", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1505", "DATE", "Date", Long, Unitless, Unitless},
    {"1506", "TIME", "Time", Long, Unitless, Unitless},
    {"1507", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1508", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"1509", "DVER", "Depth Hole (vert)", Float, Meters, Feet},
    {"1510", "LITH", "Lithology Type", Ascii, Unitless, Unitless},
    {"1511", "LPCT", "Lithology Percentage", Float, Percent, Percent},
    {"1512", "CDEN", "Cuttings Density", Float,
     KilogramsPerCubicMeter, SpecificGravity},
    {"1513", "CALC", "Calcimetry (calcite)", Float, Percent, Percent},
    {"1514", "CDOL", "Calcimetry (dolomite)", Float, Percent, Percent},
    {"1515", "SHDN", "Shale Density", Float,
     KilogramsPerCubicMeter, SpecificGravity},
    // Record 16: Hydrocarbon Show
    {"1601", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1602", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1603", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1604", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1605", "DATE", "Date", Long, Unitless, Unitless},
    {"1606", "TIME", "Time", Long, Unitless, Unitless},
    {"1607", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1608", "DSTA", "Depth Show Top (meas)", Float, Meters, Feet},
    {"1609", "DSTB", "Depth Show Bottom (meas)", Float, Meters, Feet},
    {"1610", "SHDS", "Show Description", Ascii, Unitless, Unitless},
    {"1611", "FLUO", "Fluorescence", Float, Percent, Percent},
    {"1612", "GASM", "Gas (max)", Float, Percent, Percent},
    // Record 17: Cementing
    {"1701", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1702", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1703", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1704", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1705", "DATE", "Date", Long, Unitless, Unitless},
    {"1706", "TIME", "Time", Long, Unitless, Unitless},
    {"1707", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1708", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"1709", "CPRS", "Cement Pump Pressure", Float, Kilopascals, Psi},
    {"1710", "CFLR", "Cement Flow Rate", Float,
     CubicMetersPerMinute, BarrelsPerMinute},
    {"1711", "CDEN", "Cement Density", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"1712", "CVOL", "Cement Volume Pumped (cum)", Float, CubicMeters, Barrels},
    {"1713", "CTMP", "Cement Temperature", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"1714", "CRET", "Returns Volume (cum)", Float, CubicMeters, Barrels},
    // Record 18: Drill Stem Testing
    {"1801", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1802", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1803", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1804", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1805", "DATE", "Date", Long, Unitless, Unitless},
    {"1806", "TIME", "Time", Long, Unitless, Unitless},
    {"1807", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1808", "DMEA", "Test Depth (meas)", Float, Meters, Feet},
    {"1809", "DSTN", "Test Number", Short, Unitless, Unitless},
    {"1810", "PDWN", "Pressure (dnhole)", Float, Kilopascals, Psi},
    {"1811", "TDWN", "Temperature (dnhole)", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"1812", "PSRF", "Pressure (surf)", Float, Kilopascals, Psi},
    {"1813", "FLOW", "Flow Rate (surf)", Float,
     CubicMetersPerMinute, BarrelsPerMinute},
    {"1814", "VREC", "Volume Recovered", Float, CubicMeters, Barrels},
    // Record 19: Configuration
    {"1901", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"1902", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"1903", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"1904", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"1905", "DATE", "Date", Long, Unitless, Unitless},
    {"1906", "TIME", "Time", Long, Unitless, Unitless},
    {"1907", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"1908", "RIGN", "Rig Name", Ascii, Unitless, Unitless},
    {"1909", "CNTR", "Contractor", Ascii, Unitless, Unitless},
    {"1910", "OPER", "Operator", Ascii, Unitless, Unitless},
    {"1911", "PDP1", "Pump #1 Displacement", Float, Liters, Gallons},
    {"1912", "PDP2", "Pump #2 Displacement", Float, Liters, Gallons},
    {"1913", "PDP3", "Pump #3 Displacement", Float, Liters, Gallons},
    {"1914", "KBEL", "Kelly Bushing Elevation", Float, Meters, Feet},
    {"1915", "WDEP", "Water Depth", Float, Meters, Feet},
    // Record 20: Mud Report
    {"2001", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"2002", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"2003", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"2004", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"2005", "DATE", "Date", Long, Unitless, Unitless},
    {"2006", "TIME", "Time", Long, Unitless, Unitless},
    {"2007", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"2008", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"2009", "MDEN", "Mud Density", Float,
     KilogramsPerCubicMeter, PoundsPerGallon},
    {"2010", "FVIS", "Funnel Viscosity", Float, Seconds, Seconds},
    {"2011", "MPH", "Mud pH", Float, Unitless, Unitless},
    {"2012", "MTMP", "Flowline Temperature", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"2013", "SOLD", "Solids Content", Float, Percent, Percent},
    {"2014", "OILP", "Oil Content", Float, Percent, Percent},
    {"2015", "WATP", "Water Content", Float, Percent, Percent},
    {"2016", "CHLR", "Chlorides", Float, PartsPerMillion, PartsPerMillion},
    {"2017", "MTYP", "Mud Type", Ascii, Unitless, Unitless},
    // Record 21: Bit Report
    {"2101", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"2102", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"2103", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"2104", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"2105", "DATE", "Date", Long, Unitless, Unitless},
    {"2106", "TIME", "Time", Long, Unitless, Unitless},
    {"2107", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"2108", "BITN", "Bit Number", Short, Unitless, Unitless},
    {"2109", "BSIZ", "Bit Size", Float, Millimeters, Inches},
    {"2110", "BTYP", "Bit Type", Ascii, Unitless, Unitless},
    {"2111", "BMFR", "Bit Manufacturer", Ascii, Unitless, Unitless},
    {"2112", "DIN", "Depth In", Float, Meters, Feet},
    {"2113", "DOUT", "Depth Out", Float, Meters, Feet},
    {"2114", "BHRS", "Bit Hours", Float, Hours, Hours},
    {"2115", "BGRD", "Bit Grade", Ascii, Unitless, Unitless},
    // Record 22: Remarks
    {"2201", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"2202", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"2203", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"2204", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"2205", "DATE", "Date", Long, Unitless, Unitless},
    {"2206", "TIME", "Time", Long, Unitless, Unitless},
    {"2207", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"2208", "DMEA", "Depth Hole (meas)", Float, Meters, Feet},
    {"2209", "RMKS", "Remarks", Ascii, Unitless, Unitless},
    // Record 23: Well Identification
    {"2301", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"2302", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"2303", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"2304", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"2305", "DATE", "Date", Long, Unitless, Unitless},
    {"2306", "TIME", "Time", Long, Unitless, Unitless},
    {"2307", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"2308", "WELL", "Well Name", Ascii, Unitless, Unitless},
    {"2309", "FLD", "Field Name", Ascii, Unitless, Unitless},
    {"2310", "OPCO", "Operator Company", Ascii, Unitless, Unitless},
    {"2311", "RIGN", "Rig Name", Ascii, Unitless, Unitless},
    {"2312", "LAT", "Latitude", Float, Degrees, Degrees},
    {"2313", "LON", "Longitude", Float, Degrees, Degrees},
    {"2314", "GLEV", "Ground Elevation", Float, Meters, Feet},
    {"2315", "SPUD", "Spud Date", Long, Unitless, Unitless},
    // Record 24: Vessel Motion/Mooring Status
    {"2401", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"2402", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"2403", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"2404", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"2405", "DATE", "Date", Long, Unitless, Unitless},
    {"2406", "TIME", "Time", Long, Unitless, Unitless},
    {"2407", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"2408", "HEAV", "Heave", Float, Meters, Feet},
    {"2409", "PTCH", "Pitch", Float, Degrees, Degrees},
    {"2410", "ROLL", "Roll", Float, Degrees, Degrees},
    {"2411", "HEAD", "Heading", Float, Degrees, Degrees},
    {"2412", "MTN1", "Mooring Tension #1", Float, KiloDecanewtons, KiloPounds},
    {"2413", "MTN2", "Mooring Tension #2", Float, KiloDecanewtons, KiloPounds},
    {"2414", "MTN3", "Mooring Tension #3", Float, KiloDecanewtons, KiloPounds},
    {"2415", "MTN4", "Mooring Tension #4", Float, KiloDecanewtons, KiloPounds},
    {"2416", "RISA", "Riser Angle", Float, Degrees, Degrees},
    // Record 25: Weather/Sea State
    {"2501", "WID", "Well Identifier", Ascii, Unitless, Unitless},
    {"2502", "SKNO", "Sidetrack/Hole Sect No.", Short, Unitless, Unitless},
    {"2503", "RID", "Record Identifier", Short, Unitless, Unitless},
    {"2504", "SQID", "Sequence Identifier", Long, Unitless, Unitless},
    {"2505", "DATE", "Date", Long, Unitless, Unitless},
    {"2506", "TIME", "Time", Long, Unitless, Unitless},
    {"2507", "ACTC", "Activity Code", Short, Unitless, Unitless},
    {"2508", "WDIR", "Wind Direction", Float, Degrees, Degrees},
    {"2509", "ATMP", "Air Temperature", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"2510", "BARO", "Barometric Pressure", Float, Kilopascals, Psi},
    {"2511", "WVHT", "Wave Height", Float, Meters, Feet},
    {"2512", "WVPR", "Wave Period", Float, Seconds, Seconds},
    {"2513", "WVDR", "Wave Direction", Float, Degrees, Degrees},
    {"2514", "STMP", "Sea Temperature", Float,
     DegreesCelsius, DegreesFahrenheit},
    {"2515", "CURD", "Current Direction", Float, Degrees, Degrees},
};

constexpr bool is_digits(std::string_view text) noexcept {
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

constexpr bool is_well_formed() noexcept {
  for (size_t i = 0; i < std::size(kSymbols); ++i) {
    const auto& sym = kSymbols[i];
    if (sym.code.size() != kCodeLength || !is_digits(sym.code) ||
        sym.record_type < 1) {
      return false;
    }
    if (i > 0 && !(kSymbols[i - 1].code < sym.code)) {
      return false;
    }
  }
  return true;
}

static_assert(is_well_formed(), "symbol codes must be 4 digits and unique");

}  // namespace

std::span<const Symbol> wits_level0_symbols() noexcept { return kSymbols; }

}  // namespace wits::symbols
